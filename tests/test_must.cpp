#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <string>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "jdoc/document.h"
#include "jdoc/must.h"

using jdoc::Document;

// -----------------------------------------------------------------------
// Tests for the abort-on-failure wrapper (jdoc/must.h)
// -----------------------------------------------------------------------

TEST_CASE("Must: returns the wrapped result", "[must]")
{
    auto doc = Document::from_json(R"({"name": "Alice", "n": 2})");

    std::string name = jdoc::must([&] { return doc.get_as<std::string>("name"); });
    CHECK(name == "Alice");

    int n = jdoc::must([&] { return doc.resolve_as<int>("/n"); });
    CHECK(n == 2);

    Document parsed = jdoc::must([] { return Document::from_json(R"({"k": true})"); });
    CHECK(parsed.get("k") == true);
}

TEST_CASE("Must: void operations run once", "[must]")
{
    Document doc;
    jdoc::must([&] { doc.set_recursive("/a/b", 1); });
    CHECK(doc.resolve("/a/b") == 1);
}

TEST_CASE("Must: a reference result is passed through", "[must]")
{
    auto doc = Document::from_json(R"({"list": [1, 2]})");
    const jdoc::Value& list = jdoc::must([&]() -> const jdoc::Value& { return doc.get("list"); });
    CHECK(&list == &doc.get("list"));
}

TEST_CASE("Must: a failure logs at critical level and aborts", "[must]")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        // Child: the default SIGABRT action, stderr into the pipe.
        std::signal(SIGABRT, SIG_DFL);
        close(fds[0]);
        dup2(fds[1], STDERR_FILENO);
        Document doc;
        jdoc::must([&] { return doc.get_as<std::string>("missing"); });
        _exit(0);
    }

    close(fds[1]);
    std::string output;
    char buf[256];
    ssize_t n = 0;
    while ((n = read(fds[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<std::size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    CHECK(WIFSIGNALED(status));
    CHECK(WTERMSIG(status) == SIGABRT);
    CHECK(output.find("critical") != std::string::npos);
    CHECK(output.find("key_not_found: key: missing does not exist in object: {}") != std::string::npos);
}
