// ==============================================================================
// geo.cpp - Geo Cache
// ==============================================================================

#include <auditview/geo.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

#include <utility>

namespace auditview::geo {

// ============================================================================
// Ключ кэша
// ============================================================================

std::string cache_key(std::string_view address) {
    std::string text(address);
    unsigned char octets[4] = {0, 0, 0, 0};
    if (inet_pton(AF_INET, text.c_str(), octets) == 1) {
        return std::to_string(octets[0]) + "." + std::to_string(octets[1]) + "." +
               std::to_string(octets[2]) + ".0";
    }
    return text;
}

std::string build_lookup_url(std::string_view endpoint, std::string_view key) {
    std::string url(endpoint);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += '/';
    url.append(key.data(), key.size());
    url += "?fields=";
    url += kRequestedFields;
    return url;
}

// ============================================================================
// Ошибки
// ============================================================================

const char* lookup_error_kind_to_string(LookupErrorKind kind) {
    switch (kind) {
    case LookupErrorKind::InvalidAddress:
        return "InvalidAddress";
    case LookupErrorKind::Network:
        return "Network";
    case LookupErrorKind::Http:
        return "Http";
    case LookupErrorKind::Parse:
        return "Parse";
    case LookupErrorKind::Remote:
        return "Remote";
    }
    return "Unknown";
}

std::string LookupError::format() const {
    return "lookup of '" + key + "' failed - " + message;
}

namespace {

LookupResult fail(LookupErrorKind kind, std::string message, std::string_view key) {
    LookupResult result;
    result.ok = false;
    result.error = LookupError{kind, std::move(message), std::string(key)};
    return result;
}

std::optional<std::string> get_string(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<double> get_double(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsNumber()) {
        return std::nullopt;
    }
    return it->value.GetDouble();
}

std::optional<int> get_int(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsInt()) {
        return std::nullopt;
    }
    return it->value.GetInt();
}

std::optional<bool> get_bool(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsBool()) {
        return std::nullopt;
    }
    return it->value.GetBool();
}

}  // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

LookupResult parse_geo_response(std::string_view body, std::string_view key) {
    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        return fail(LookupErrorKind::Parse,
                    std::string("invalid JSON response: ") +
                        rapidjson::GetParseError_En(doc.GetParseError()),
                    key);
    }
    if (!doc.IsObject()) {
        return fail(LookupErrorKind::Parse, "response is not a JSON object", key);
    }

    auto status = get_string(doc, "status");
    if (!status) {
        return fail(LookupErrorKind::Parse, "response has no status field", key);
    }

    auto record = std::make_shared<GeoRecord>();
    record->status = *status;
    record->query = get_string(doc, "query");
    record->message = get_string(doc, "message");

    if (record->status != "success") {
        return fail(LookupErrorKind::Remote,
                    record->message ? *record->message : "status '" + record->status + "'",
                    key);
    }

    record->continent = get_string(doc, "continent");
    record->continent_code = get_string(doc, "continentCode");
    record->country = get_string(doc, "country");
    record->country_code = get_string(doc, "countryCode");
    record->region = get_string(doc, "region");
    record->region_name = get_string(doc, "regionName");
    record->city = get_string(doc, "city");
    record->district = get_string(doc, "district");
    record->zip = get_string(doc, "zip");
    record->lat = get_double(doc, "lat");
    record->lon = get_double(doc, "lon");
    record->timezone = get_string(doc, "timezone");
    record->offset = get_int(doc, "offset");
    record->currency = get_string(doc, "currency");
    record->isp = get_string(doc, "isp");
    record->org = get_string(doc, "org");
    record->as_info = get_string(doc, "as");
    record->asname = get_string(doc, "asname");
    record->mobile = get_bool(doc, "mobile");
    record->proxy = get_bool(doc, "proxy");
    record->hosting = get_bool(doc, "hosting");

    LookupResult result;
    result.ok = true;
    result.record = std::move(record);
    return result;
}

void geo_record_to_value(const GeoRecord& record, rapidjson::Value& out,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc) {
    out.SetObject();

    auto add_string = [&](const char* name, const std::optional<std::string>& value) {
        if (value) {
            out.AddMember(rapidjson::StringRef(name),
                          rapidjson::Value(value->c_str(),
                                           static_cast<rapidjson::SizeType>(value->size()), alloc),
                          alloc);
        }
    };

    add_string("query", record.query);
    out.AddMember("status", rapidjson::Value(record.status.c_str(), alloc), alloc);
    add_string("message", record.message);
    add_string("continent", record.continent);
    add_string("continentCode", record.continent_code);
    add_string("country", record.country);
    add_string("countryCode", record.country_code);
    add_string("region", record.region);
    add_string("regionName", record.region_name);
    add_string("city", record.city);
    add_string("district", record.district);
    add_string("zip", record.zip);
    if (record.lat) {
        out.AddMember("lat", *record.lat, alloc);
    }
    if (record.lon) {
        out.AddMember("lon", *record.lon, alloc);
    }
    add_string("timezone", record.timezone);
    if (record.offset) {
        out.AddMember("offset", *record.offset, alloc);
    }
    add_string("currency", record.currency);
    add_string("isp", record.isp);
    add_string("org", record.org);
    add_string("as", record.as_info);
    add_string("asname", record.asname);
    if (record.mobile) {
        out.AddMember("mobile", *record.mobile, alloc);
    }
    if (record.proxy) {
        out.AddMember("proxy", *record.proxy, alloc);
    }
    if (record.hosting) {
        out.AddMember("hosting", *record.hosting, alloc);
    }
}

std::string geo_record_to_json(const GeoRecord& record, bool pretty) {
    rapidjson::Document doc;
    geo_record_to_value(record, doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ============================================================================
// GeoCache
// ============================================================================

GeoCache::GeoCache(std::shared_ptr<HttpTransport> transport, std::string endpoint)
    : transport_(std::move(transport)), endpoint_(std::move(endpoint)) {}

LookupResult GeoCache::lookup(std::string_view address) {
    if (address.empty()) {
        return fail(LookupErrorKind::InvalidAddress, "empty address", address);
    }

    std::string key = cache_key(address);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            LookupResult hit;
            hit.ok = true;
            hit.record = it->second;
            hit.from_cache = true;
            return hit;
        }
    }

    if (!transport_) {
        return fail(LookupErrorKind::Network, "no HTTP transport configured", key);
    }

    HttpResult http = transport_->get(build_lookup_url(endpoint_, key));
    if (!http) {
        return fail(LookupErrorKind::Network, http.error, key);
    }
    if (http.response.status != 200) {
        return fail(LookupErrorKind::Http, "HTTP status " + std::to_string(http.response.status),
                    key);
    }

    LookupResult parsed = parse_geo_response(http.response.body, key);
    if (!parsed) {
        return parsed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = entries_.try_emplace(key, parsed.record);
    parsed.record = inserted.first->second;
    parsed.from_cache = false;
    return parsed;
}

std::shared_ptr<const GeoRecord> GeoCache::cached(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t GeoCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

LookupResult lookup_address(GeoCache& cache, std::string_view address) {
    return cache.lookup(address);
}

}  // namespace auditview::geo
