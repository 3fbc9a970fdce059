#include "http/CurlTransport.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

using namespace wb::http;
using namespace wb::util;
using namespace wb::log;

CurlTransport::CurlTransport(config::HttpConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

Response CurlTransport::perform(const Request& req) {
    SList hdrs;
    for (const auto& [name, value] : req.headers) hdrs.add(name + ": " + value);
    // libcurl would otherwise stall large PUTs waiting on 100-continue
    hdrs.add("Expect:");

    char errbuf[CURL_ERROR_SIZE] = {0};

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, cfg_.connect_timeout_seconds);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, cfg_.low_speed_time_seconds);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, cfg_.low_speed_limit_bytes);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());

        if (req.method == "HEAD") {
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        } else if (req.method != "GET") {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        }
    });

    Response out;
    out.curl = static_cast<int>(resp.curl);
    out.http = resp.http;
    out.body = resp.body;
    out.hdr = resp.hdr;

    if (resp.curl != CURLE_OK) {
        out.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(resp.curl));
        Registry::http()->warn("[CurlTransport] {} {} failed: {}", req.method, req.url, out.error);
    } else {
        Registry::http()->debug("[CurlTransport] {} {} -> HTTP {}", req.method, req.url, resp.http);
    }

    return out;
}
