/*
 * curl_transport.cpp
 *
 * - head(): metadata probe, headers collected lower-case
 * - get(): small GET with extra headers, body discarded and capped
 * - downloadFile(): streams into the destination, appending after resumeFrom when the
 *   server answers 206, rewriting from zero when it ignores Range and answers 200
 * - cancellation is polled from the write and xferinfo callbacks
 */

#include <chartdl/downloader/curl_transport.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string_view>
#include <system_error>

namespace chartdl::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Error makeHttpError(long status, std::string_view url) {
    std::string msg = "HTTP " + std::to_string(status) + " for " + std::string(url);
    if (status == 416)
        return Error{ErrorCode::RangeNotSatisfiable, std::move(msg)};
    if (status == 404 || status == 410)
        return Error{ErrorCode::NotFound, std::move(msg)};
    if (status == 408 || status == 429)
        return Error{ErrorCode::NetworkError, std::move(msg)};
    if (status >= 500)
        return Error{ErrorCode::ServerError, std::move(msg)};
    return Error{ErrorCode::Unknown, std::move(msg)};
}

struct EasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList(list);
}

// Collects response headers; a new status line (redirect hop) starts over.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* out = static_cast<HttpResponse*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.rfind("HTTP/", 0) == 0) {
        out->headers.clear();
        auto sp = line.find(' ');
        if (sp != std::string_view::npos)
            out->statusCode = std::atoi(std::string(line.substr(sp + 1, 3)).c_str());
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        out->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total;
}

constexpr std::size_t kMaxDiscardedBody = 64 * 1024;

struct DiscardContext {
    std::size_t seen{0};
    bool capped{false};
};

size_t discard_cb(char*, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DiscardContext*>(userdata);
    ctx->seen += size * nmemb;
    if (ctx->seen > kMaxDiscardedBody) {
        // server ignored a small Range; stop instead of pulling the whole body
        ctx->capped = true;
        return 0;
    }
    return size * nmemb;
}

struct FileSink {
    CURL* curl{nullptr};
    const std::filesystem::path* destination{nullptr};
    const CancelToken* token{nullptr};
    const TransferProgressCallback* onProgress{nullptr};
    std::uint64_t resumeFrom{0};

    std::ofstream out;
    bool opened{false};
    long status{0};
    std::uint64_t base{0};
    std::uint64_t written{0};
    std::optional<std::uint64_t> total{};
    bool cancelled{false};
    std::optional<Error> ioError{};
};

bool open_sink(FileSink& s) {
    curl_easy_getinfo(s.curl, CURLINFO_RESPONSE_CODE, &s.status);
    if (s.status >= 400)
        return true; // error body is drained, status decides the result

    std::ios::openmode mode = std::ios::binary | std::ios::out;
    if (s.resumeFrom > 0 && s.status == 206) {
        mode |= std::ios::app;
        s.base = s.resumeFrom;
    } else {
        if (s.resumeFrom > 0)
            spdlog::debug("Server ignored Range for {}, rewriting from zero",
                          s.destination->string());
        mode |= std::ios::trunc;
        s.base = 0;
    }
    s.out.open(*s.destination, mode);
    if (!s.out) {
        const int err = errno;
        std::error_code ec(err, std::generic_category());
        auto code =
            (err == EACCES || err == EPERM) ? ErrorCode::PermissionDenied : ErrorCode::IoError;
        s.ioError = Error{code, "Cannot open " + s.destination->string() + ": " + ec.message()};
        return false;
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(s.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
        length >= 0) {
        s.total = s.base + static_cast<std::uint64_t>(length);
    }
    s.opened = true;
    return true;
}

size_t file_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* s = static_cast<FileSink*>(userdata);
    if (s->token->isCancelled()) {
        s->cancelled = true;
        return 0;
    }
    if (!s->opened && s->status < 400) {
        if (!open_sink(*s))
            return 0;
    }
    if (s->status >= 400)
        return total;

    s->out.write(ptr, static_cast<std::streamsize>(total));
    if (!s->out) {
        s->ioError = Error{ErrorCode::IoError, "Write failed for " + s->destination->string()};
        return 0;
    }
    s->written += total;
    if (*s->onProgress)
        (*s->onProgress)(s->base + s->written, s->total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* s = static_cast<FileSink*>(userdata);
    if (s->token->isCancelled()) {
        s->cancelled = true;
        return 1;
    }
    return 0;
}

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
    });
}

class CurlTransport final : public ITransportClient {
public:
    explicit CurlTransport(TransportOptions options) : options_(std::move(options)) {
        ensure_global_init();
    }

    Expected<HttpResponse> head(std::string_view url) override {
        auto curl = newHandle(url);
        if (!curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        HttpResponse resp;
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resp);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK)
            return makeCurlError(rc, "HEAD");
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        resp.statusCode = static_cast<int>(status);
        return resp;
    }

    Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers) override {
        auto curl = newHandle(url);
        if (!curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        auto list = build_header_list(headers);
        HttpResponse resp;
        DiscardContext body;
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resp);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && body.capped))
            return makeCurlError(rc, "GET");
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        resp.statusCode = static_cast<int>(status);
        return resp;
    }

    Expected<void> downloadFile(std::string_view url, const std::filesystem::path& destination,
                                const CancelToken& token,
                                const TransferProgressCallback& onProgress,
                                std::optional<std::uint64_t> resumeFrom) override {
        if (token.isCancelled())
            return Error{ErrorCode::Cancelled, "Transfer cancelled"};

        auto curl = newHandle(url);
        if (!curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        FileSink sink;
        sink.curl = curl.get();
        sink.destination = &destination;
        sink.token = &token;
        sink.onProgress = &onProgress;
        sink.resumeFrom = resumeFrom.value_or(0);

        std::vector<Header> headers;
        if (sink.resumeFrom > 0)
            headers.push_back({"Range", "bytes=" + std::to_string(sink.resumeFrom) + "-"});
        auto list = build_header_list(headers);

        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, file_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &sink);

        CURLcode rc = curl_easy_perform(curl.get());
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (sink.out.is_open()) {
            sink.out.flush();
            if (!sink.out && !sink.ioError)
                sink.ioError = Error{ErrorCode::IoError, "Flush failed for " + destination.string()};
            sink.out.close();
        }

        if (sink.cancelled || token.isCancelled())
            return Error{ErrorCode::Cancelled, "Transfer cancelled"};
        if (sink.ioError)
            return *sink.ioError;
        if (rc != CURLE_OK)
            return makeCurlError(rc, "GET");
        if (status >= 400)
            return makeHttpError(status, url);

        if (!sink.opened) {
            // empty body: a 206 adds nothing, anything else leaves an empty file
            if (!(sink.resumeFrom > 0 && status == 206)) {
                std::ofstream touch(destination, std::ios::binary | std::ios::trunc);
                if (!touch)
                    return Error{ErrorCode::IoError, "Cannot create " + destination.string()};
            }
        }
        if (onProgress && sink.opened && sink.written == 0)
            onProgress(sink.base, sink.total);
        return {};
    }

private:
    EasyHandle newHandle(std::string_view url) const {
        EasyHandle curl(curl_easy_init());
        if (!curl)
            return curl;
        CURL* c = curl.get();
        curl_easy_setopt(c, CURLOPT_URL, std::string(url).c_str());
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_USERAGENT, options_.userAgent.c_str());
        curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connectTimeout.count()));
        if (options_.stallTimeout.count() > 0) {
            long seconds = std::max<long>(1, static_cast<long>(options_.stallTimeout.count() / 1000));
            curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, seconds);
        }

        curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
        curl_easy_setopt(c, CURLOPT_MAXREDIRS, 5L);

        curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
        curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);
        if (!options_.caPath.empty())
            curl_easy_setopt(c, CURLOPT_CAINFO, options_.caPath.c_str());
        if (options_.proxy && !options_.proxy->empty())
            curl_easy_setopt(c, CURLOPT_PROXY, options_.proxy->c_str());

        curl_easy_setopt(c, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(c, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(c, CURLOPT_TCP_KEEPINTVL, 15L);
        return curl;
    }

    TransportOptions options_;
};

} // namespace

TransportOptions transportOptionsFrom(const DownloaderConfig& config) {
    TransportOptions o;
    o.connectTimeout = config.connectTimeout;
    o.stallTimeout = config.stallTimeout;
    o.verifyTls = config.verifyTls;
    return o;
}

std::shared_ptr<ITransportClient> makeCurlTransport(TransportOptions options) {
    return std::make_shared<CurlTransport>(std::move(options));
}

} // namespace chartdl::downloader
