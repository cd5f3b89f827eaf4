#pragma once

#include "sqlfrag/builders.h"
#include "sqlfrag/compile.h"
#include "sqlfrag/diagnostics.h"
#include "sqlfrag/errors.h"
#include "sqlfrag/fragment.h"
#include "sqlfrag/value.h"
#include "sqlfrag/version.h"
