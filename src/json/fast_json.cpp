#include "mcpsrv/json/fast_json.hpp"

namespace mcpsrv {

namespace {

tl::unexpected<JsonParseError> failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

}  // namespace

JsonParseResult FastJsonParser::parse(std::string_view text) {
    simdjson::padded_string padded(text);

    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return failure(doc_result.error());
    }

    try {
        auto doc = std::move(doc_result).value();

        auto scalar = doc.is_scalar();
        if (scalar.error() != simdjson::SUCCESS) {
            return failure(scalar.error());
        }

        JsonParseResult converted;
        if (scalar.value() == true) {
            converted = convert_scalar_root(doc);
        } else {
            auto root = doc.get_value();
            if (root.error() != simdjson::SUCCESS) {
                return failure(root.error());
            }
            converted = convert(root.value(), 0);
        }
        if (!converted) {
            return converted;
        }

        if (doc.at_end() == false) {
            std::size_t offset = 0;
            auto location = doc.current_location();
            if (location.error() == simdjson::SUCCESS) {
                offset = static_cast<std::size_t>(location.value() - padded.data());
            }
            return tl::unexpected(JsonParseError("trailing content after JSON document", offset));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonParseResult FastJsonParser::convert_scalar_root(simdjson::ondemand::document& doc) {
    auto type = doc.type();
    if (type.error() != simdjson::SUCCESS) {
        return failure(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::string: {
            auto str = doc.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return failure(str.error());
            }
            return Json(std::string(str.value()));
        }
        case simdjson::ondemand::json_type::number: {
            auto number = doc.get_number();
            if (number.error() != simdjson::SUCCESS) {
                return failure(number.error());
            }
            const auto n = number.value();
            if (n.is_int64()) return Json(n.get_int64());
            if (n.is_uint64()) return Json(n.get_uint64());
            return Json(n.get_double());
        }
        case simdjson::ondemand::json_type::boolean: {
            auto flag = doc.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return failure(flag.error());
            }
            return Json(flag.value());
        }
        case simdjson::ondemand::json_type::null: {
            auto is_null = doc.is_null();
            if (is_null.error() != simdjson::SUCCESS || is_null.value() == false) {
                return tl::unexpected(JsonParseError("invalid literal"));
            }
            return Json(nullptr);
        }
        default:
            break;
    }
    return tl::unexpected(JsonParseError("unexpected JSON root"));
}

JsonParseResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return failure(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return failure(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return failure(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return failure(str.error());
            }
            return Json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            auto number = value.get_number();
            if (number.error() != simdjson::SUCCESS) {
                return failure(number.error());
            }
            const auto n = number.value();
            if (n.is_int64()) return Json(n.get_int64());
            if (n.is_uint64()) return Json(n.get_uint64());
            return Json(n.get_double());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return failure(flag.error());
            }
            return Json(flag.value());
        }

        case simdjson::ondemand::json_type::null: {
            auto is_null = value.is_null();
            if (is_null.error() != simdjson::SUCCESS || is_null.value() == false) {
                return tl::unexpected(JsonParseError("invalid literal"));
            }
            return Json(nullptr);
        }

        default:
            break;
    }

    return tl::unexpected(JsonParseError("unknown JSON type"));
}

JsonParseResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    Json result = Json::object();

    for (auto field : obj) {
        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return failure(key.error());
        }
        std::string name(key.value());

        auto member = field.value();
        if (member.error() != simdjson::SUCCESS) {
            return failure(member.error());
        }

        auto converted = convert(member.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(name)] = std::move(*converted);
    }

    return result;
}

JsonParseResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    Json result = Json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return failure(element.error());
        }

        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

JsonParseResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

JsonParseResult fast_parse(std::string_view text, std::size_t max_depth) {
    if (max_depth == FastJsonConfig{}.max_depth) {
        return fast_parse(text);
    }
    FastJsonParser parser(FastJsonConfig{max_depth});
    return parser.parse(text);
}

}  // namespace mcpsrv
