#pragma once
#include <string>
#include <variant>
#include <vector>
#include <map>
#include <cstdint>

namespace mpay {
struct JNull{};
using JVal = std::variant<JNull, bool, double, std::string, std::vector<class JNode>, std::map<std::string, class JNode>>;
class JNode { public: JVal v; };
using JObject = std::map<std::string, JNode>;
using JArray = std::vector<JNode>;

bool json_parse(const std::string& s, JNode& out);
// Compact single-line rendering; strings are escaped
std::string json_dump(const JNode& n);

// Builders
JNode jstr(const std::string& s);
JNode jnum(double d);
JNode jbool(bool b);
JNode jobj(const JObject& m);

// Typed lookups on an object node; false when missing or of another type
bool json_get_string(const JNode& obj, const std::string& key, std::string& out);
bool json_get_u64(const JNode& obj, const std::string& key, uint64_t& out);
}
