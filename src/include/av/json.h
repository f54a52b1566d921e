#pragma once

#include <av/value.h>
#include <string>

namespace av {

// Parse JSON text into a Value. `//`, `/* */` and `#` comments between
// tokens are skipped. Throws av::ParseError with line/column on errors.
Value parse_json(const std::string& text);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace av
