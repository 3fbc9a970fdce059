#pragma once

#include "http/Transport.hpp"
#include "config/Config.hpp"

namespace wb::http {

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(config::HttpConfig cfg);

    Response perform(const Request& req) override;

private:
    config::HttpConfig cfg_;
};

}
