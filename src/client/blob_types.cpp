/**
 * @file blob_types.cpp
 * @brief Decoding of blob descriptors and listings, put header construction
 */

#include <kcenon/blob/client/blob_types.h>

#include <kcenon/blob/core/blob_utils.h>

#include <exception>

namespace kcenon::blob {

namespace {

auto string_field(const Json::Value& value, const char* name) -> std::optional<std::string> {
    if (value.isMember(name) && value[name].isString()) {
        return value[name].asString();
    }
    return std::nullopt;
}

auto size_field(const Json::Value& value) -> uint64_t {
    const auto& size = value["size"];
    if (size.isUInt64()) {
        return size.asUInt64();
    }
    if (size.isString()) {
        try {
            return std::stoull(size.asString());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

auto uploaded_at_field(const Json::Value& value) -> std::chrono::system_clock::time_point {
    const auto& uploaded = value["uploadedAt"];
    if (uploaded.isString()) {
        if (auto parsed = blob_utils::parse_timestamp(uploaded.asString())) {
            return *parsed;
        }
    } else if (uploaded.isNumeric()) {
        return std::chrono::system_clock::time_point(
            std::chrono::milliseconds(uploaded.asInt64()));
    }
    return {};
}

auto require_locator(const Json::Value& value, const char* what) -> result<void> {
    if (!value.isObject()) {
        return unexpected(error{error_code::invalid_response_json,
                                std::string(what) + " is not a JSON object"});
    }
    if (!string_field(value, "url") || !string_field(value, "pathname")) {
        return unexpected(error{error_code::invalid_response_json,
                                std::string(what) + " lacks url or pathname"});
    }
    return {};
}

}  // namespace

auto put_blob_result::from_json(const Json::Value& value) -> result<put_blob_result> {
    if (auto valid = require_locator(value, "blob descriptor"); !valid) {
        return unexpected(valid.error());
    }

    put_blob_result descriptor;
    descriptor.url = value["url"].asString();
    descriptor.pathname = value["pathname"].asString();
    descriptor.download_url = string_field(value, "downloadUrl").value_or("");
    descriptor.content_type = string_field(value, "contentType").value_or("");
    descriptor.content_disposition = string_field(value, "contentDisposition").value_or("");

    for (const auto& name : value.getMemberNames()) {
        if (name == "url" || name == "downloadUrl" || name == "pathname" ||
            name == "contentType" || name == "contentDisposition") {
            continue;
        }
        descriptor.extra[name] = value[name];
    }
    return descriptor;
}

auto head_blob_result::from_json(const Json::Value& value) -> result<head_blob_result> {
    if (auto valid = require_locator(value, "blob metadata"); !valid) {
        return unexpected(valid.error());
    }

    head_blob_result metadata;
    metadata.size = size_field(value);
    metadata.uploaded_at = uploaded_at_field(value);
    metadata.pathname = value["pathname"].asString();
    metadata.content_type = string_field(value, "contentType").value_or("");
    metadata.content_disposition = string_field(value, "contentDisposition").value_or("");
    metadata.url = value["url"].asString();
    metadata.download_url = string_field(value, "downloadUrl").value_or("");
    metadata.cache_control = string_field(value, "cacheControl").value_or("");
    return metadata;
}

auto list_blob_item::from_json(const Json::Value& value) -> result<list_blob_item> {
    if (auto valid = require_locator(value, "listed blob"); !valid) {
        return unexpected(valid.error());
    }

    list_blob_item item;
    item.url = value["url"].asString();
    item.download_url = string_field(value, "downloadUrl").value_or("");
    item.pathname = value["pathname"].asString();
    item.size = size_field(value);
    item.uploaded_at = uploaded_at_field(value);
    return item;
}

auto list_blob_result::from_json(const Json::Value& value) -> result<list_blob_result> {
    if (!value.isObject()) {
        return unexpected(error{error_code::invalid_response_json,
                                "listing is not a JSON object"});
    }

    list_blob_result page;
    const auto& blobs = value["blobs"];
    if (!blobs.isNull() && !blobs.isArray()) {
        return unexpected(error{error_code::invalid_response_json,
                                "listing blobs is not an array"});
    }
    for (const auto& entry : blobs) {
        auto item = list_blob_item::from_json(entry);
        if (!item) {
            return unexpected(item.error());
        }
        page.blobs.push_back(std::move(item.value()));
    }

    page.cursor = string_field(value, "cursor");
    page.has_more = value["hasMore"].isBool() && value["hasMore"].asBool();
    for (const auto& folder : value["folders"]) {
        if (folder.isString()) {
            page.folders.push_back(folder.asString());
        }
    }
    return page;
}

auto list_blob_result::next_cursor() const -> std::optional<std::string> {
    if (!has_more || !cursor || cursor->empty()) {
        return std::nullopt;
    }
    return cursor;
}

auto create_folder_result::from_json(const Json::Value& value) -> result<create_folder_result> {
    if (auto valid = require_locator(value, "folder descriptor"); !valid) {
        return unexpected(valid.error());
    }
    return create_folder_result{value["pathname"].asString(), value["url"].asString()};
}

auto make_put_headers(const put_options& options) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> headers;
    headers["x-vercel-blob-access"] = to_string(options.access);
    if (options.content_type && !options.content_type->empty()) {
        headers["x-content-type"] = *options.content_type;
    }
    headers["x-add-random-suffix"] = options.add_random_suffix ? "1" : "0";
    headers["x-allow-overwrite"] = options.allow_overwrite ? "1" : "0";
    if (options.cache_control_max_age) {
        headers["x-cache-control-max-age"] = std::to_string(*options.cache_control_max_age);
    }
    return headers;
}

auto make_put_headers(const copy_options& options) -> std::map<std::string, std::string> {
    put_options equivalent;
    equivalent.access = options.access;
    equivalent.content_type = options.content_type;
    equivalent.add_random_suffix = options.add_random_suffix;
    equivalent.allow_overwrite = options.allow_overwrite;
    equivalent.cache_control_max_age = options.cache_control_max_age;
    return make_put_headers(equivalent);
}

}  // namespace kcenon::blob
