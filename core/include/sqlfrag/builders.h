#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sqlfrag/fragment.h"
#include "sqlfrag/value.h"

namespace sqlfrag {

/// Single literal part. The caller asserts the text is safe SQL.
Fragment literal(const std::string& text);
/// Single placeholder bound to v.
Fragment value(Value v);
/// Single open slot.
Fragment slot(const std::string& name);
/// Double-quoted identifier with embedded quotes doubled; `"prefix"."name"` when
/// a non-empty prefix is given.
Fragment identifier(const std::string& name, const std::optional<std::string>& prefix = std::nullopt);

/// Joins parts with ", ". Empty input gives an empty fragment.
Fragment list(const std::vector<Fragment>& parts);
/// Parenthesizes each part and joins with " AND ". Empty input gives TRUE.
Fragment all(const std::vector<Fragment>& parts);
/// Parenthesizes each part and joins with " OR ". Empty input gives FALSE.
Fragment any(const std::vector<Fragment>& parts);

/// Renders a value as an inline SQL literal (not a placeholder).
/// Throws TypeError for JSON documents and ValueError for NaN/infinite floats.
std::string escape(const Value& v);

/// Transposes rows into per-column arrays: `UNNEST($1::T1[], $2::T2[], ...)`.
/// JSON/JSONB columns are sent as text arrays and cast back.
/// Throws ArityError when a row's width differs from column_types.size().
Fragment unnest(const std::vector<std::vector<Value>>& rows,
                const std::vector<std::string>& column_types);

}  // namespace sqlfrag
