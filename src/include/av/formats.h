#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <av/value.h>

namespace av {

// A format predicate. Values the format does not apply to (a number under
// "email", a string under "int32") must pass.
using FormatCheck = std::function<bool(const Value&)>;

class FormatRegistry {
  public:
    FormatRegistry() = default;

    // date, date-time, time, email, uuid, ipv4, ipv6, hostname, uri,
    // int32, int64, float, double
    static FormatRegistry with_builtins();

    // Adds or replaces the predicate for `name`.
    void add(const std::string& name, FormatCheck check);
    const FormatCheck* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    std::vector<std::string> names() const;

  private:
    std::map<std::string, FormatCheck> checks_;
};

namespace formats {
    bool is_date(const std::string& s);
    bool is_time(const std::string& s);
    bool is_date_time(const std::string& s);
    bool is_email(const std::string& s);
    bool is_uuid(const std::string& s);
    bool is_ipv4(const std::string& s);
    bool is_ipv6(const std::string& s);
    bool is_hostname(const std::string& s);
    bool is_uri(const std::string& s);
}  // namespace formats

}  // namespace av
