#include "util/config_json_utils.hpp"

#include <fstream>

namespace forge::config::detail {

namespace {

Result WrongType(const char* key, const char* expected) {
    return Result::Fail(ErrorCode::InvalidArgument,
                        std::string("config key '") + key + "' must be " + expected);
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::NotFound, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::InvalidArgument, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorCode::InvalidArgument, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return WrongType(key, "a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return WrongType(key, "an integer");
    auto v = it->get<long long>();
    if (v < 0)
        return WrongType(key, "non-negative");
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return WrongType(key, "a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result GetStringListIfPresent(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_array())
        return WrongType(key, "an array of strings");

    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string())
            return WrongType(key, "an array of strings");
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return Result::Ok();
}

} // namespace forge::config::detail
