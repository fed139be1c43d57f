// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <type_traits>
#include <vector>
#include "logging.hpp"

namespace schemaver {

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jdaloc = rapidjson::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON string into a RapidJSON Document; logs and returns false on error.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            SCHEMAVER_LOG_ERROR("JSON parse error", {
                StringField("error", rapidjson::GetParseError_En(document.GetParseError())),
                IntField("offset", static_cast<std::int64_t>(document.GetErrorOffset()))});
            return false;
        }
        return true;
    }

    // Parses a JSON file into a RapidJSON Document.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            SCHEMAVER_LOG_ERROR("failed to open file", {StringField("path", file_path)});
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            SCHEMAVER_LOG_ERROR("JSON parse error", {
                StringField("path", file_path),
                StringField("error", rapidjson::GetParseError_En(document.GetParseError())),
                IntField("offset", static_cast<std::int64_t>(document.GetErrorOffset()))});
            return false;
        }
        return true;
    }

    inline std::string stringify(const rapidjson::Document& document, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            document.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            document.Accept(writer);
        }
        return buffer.GetString();
    }

    // Returns the member value, or default_value when missing or of another type.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        }
        return default_value;
    }

    // String members of an array; non string elements are skipped.
    inline std::vector<std::string> get_strings(const rapidjson::Value& parent, const std::string& key) {
        std::vector<std::string> ret;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return ret;
        const jval& arr = parent.FindMember(key.c_str())->value;
        if (!arr.IsArray()) return ret;
        for (const auto& el : arr.GetArray()) {
            if (el.IsString()) ret.emplace_back(el.GetString());
        }
        return ret;
    }

    inline jval str_val(const std::string& value, jdaloc& a) {
        return jval(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), a);
    }

} // namespace jhlp

} // namespace schemaver
