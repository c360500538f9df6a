#pragma once

// Convenience header: the whole jdoc library.

#include "error.h"
#include "log.h"
#include "must.h"
#include "path.h"
#include "value.h"
#include "codec.h"
#include "hash.h"
#include "rfc3339.h"
#include "typed.h"
#include "merge_patch.h"
#include "document.h"
#include "collector.h"
#include "csv.h"
#include "asset.h"
#include "schema.h"
