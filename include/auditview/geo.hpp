// ==============================================================================
// auditview/geo.hpp - Geo Cache: геолокация адресов клиентов
// ==============================================================================
//
// Назначение:
// - cache_key(): ключ кэша: /24 для IPv4, полный адрес для IPv6
// - GeoRecord: ответ сервиса геолокации (все поля необязательны)
// - HttpTransport: абстракция HTTP GET (CurlTransport: реализация на libcurl)
// - GeoCache: кэш под мьютексом: не более одного удачного запроса на ключ
//
// Ошибки (сеть, HTTP, JSON, status != "success") не кэшируются:
// следующий lookup с тем же ключом повторит запрос.
//
// ==============================================================================

#ifndef AUDITVIEW_GEO_HPP
#define AUDITVIEW_GEO_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace auditview::geo {

// ----------------------------------------------------------------------------
// Ключ кэша
// ----------------------------------------------------------------------------

/// IPv4 → "a.b.c.0"; IPv6 и нераспознанные адреса → строка без изменений
std::string cache_key(std::string_view address);

// ----------------------------------------------------------------------------
// GeoRecord
// ----------------------------------------------------------------------------

constexpr const char* kDefaultEndpoint = "http://ip-api.com/json";

/// Запрашиваемые поля (параметр fields)
constexpr const char* kRequestedFields =
    "query,status,message,continent,continentCode,country,countryCode,region,regionName,"
    "city,district,zip,lat,lon,timezone,offset,currency,isp,org,as,asname,mobile,proxy,"
    "hosting";

/// Ответ сервиса. Неизменяем после помещения в кэш.
struct GeoRecord {
    std::optional<std::string> query;
    std::string status;
    std::optional<std::string> message;

    // Геолокация
    std::optional<std::string> continent;
    std::optional<std::string> continent_code;
    std::optional<std::string> country;
    std::optional<std::string> country_code;
    std::optional<std::string> region;
    std::optional<std::string> region_name;
    std::optional<std::string> city;
    std::optional<std::string> district;
    std::optional<std::string> zip;
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<std::string> timezone;
    std::optional<int> offset;
    std::optional<std::string> currency;

    // Сеть
    std::optional<std::string> isp;
    std::optional<std::string> org;
    std::optional<std::string> as_info;  // поле "as"
    std::optional<std::string> asname;

    // Признаки
    std::optional<bool> mobile;
    std::optional<bool> proxy;
    std::optional<bool> hosting;
};

/// Заполнить out JSON-объектом с именами полей сервиса ("countryCode", "as", ...);
/// отсутствующие поля опускаются
void geo_record_to_value(const GeoRecord& record, rapidjson::Value& out,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc);

/// То же, сериализованное в строку
std::string geo_record_to_json(const GeoRecord& record, bool pretty = true);

/// URL запроса: "<endpoint>/<key>?fields=..."
std::string build_lookup_url(std::string_view endpoint, std::string_view key);

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class LookupErrorKind {
    InvalidAddress,  // пустой адрес
    Network,         // запрос не выполнен
    Http,            // код ответа не 200
    Parse,           // тело ответа не JSON-объект
    Remote           // status != "success"
};

const char* lookup_error_kind_to_string(LookupErrorKind kind);

struct LookupError {
    LookupErrorKind kind = LookupErrorKind::Network;
    std::string message;
    std::string key;

    /// "lookup of '<key>' failed - <message>"
    std::string format() const;
};

struct LookupResult {
    bool ok = false;
    std::shared_ptr<const GeoRecord> record;
    /// true если запрос в сеть не выполнялся
    bool from_cache = false;
    LookupError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать тело ответа сервиса
LookupResult parse_geo_response(std::string_view body, std::string_view key);

// ----------------------------------------------------------------------------
// HTTP
// ----------------------------------------------------------------------------

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct HttpResult {
    bool ok = false;
    HttpResponse response;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Синхронный HTTP GET. Реализации должны допускать вызов из нескольких потоков.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult get(const std::string& url) = 0;
};

/// HTTP GET через libcurl (отдельный easy handle на запрос)
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_ms = 5000);

    HttpResult get(const std::string& url) override;

private:
    long timeout_ms_;
};

// ----------------------------------------------------------------------------
// GeoCache
// ----------------------------------------------------------------------------

/// Кэш на время жизни процесса; записи не вытесняются.
///
/// Проверка и вставка выполняются под одним мьютексом. Запрос в сеть идёт
/// без блокировки, поэтому два одновременных промаха по одному ключу могут
/// оба обратиться к сервису; в кэше остаётся первая вставленная запись,
/// и оба вызова возвращают именно её.
class GeoCache {
public:
    explicit GeoCache(std::shared_ptr<HttpTransport> transport,
                      std::string endpoint = kDefaultEndpoint);

    GeoCache(const GeoCache&) = delete;
    GeoCache& operator=(const GeoCache&) = delete;

    LookupResult lookup(std::string_view address);

    /// Запись по ключу без обращения к сети
    std::shared_ptr<const GeoRecord> cached(std::string_view key) const;

    std::size_t size() const;

    const std::string& endpoint() const { return endpoint_; }

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string endpoint_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const GeoRecord>> entries_;
};

/// Найти геоданные для адреса клиента
LookupResult lookup_address(GeoCache& cache, std::string_view address);

}  // namespace auditview::geo

#endif  // AUDITVIEW_GEO_HPP
