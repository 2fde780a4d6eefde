#pragma once

#include "config/Settings.hpp"
#include "infrastructure/HotStreakResponseParser.hpp"
#include "services/IPayloadSource.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace mld::infrastructure {

// GraphQL client for the sportsbook API. search carries the markets64 blobs,
// system carries the category name table.
class HotStreakClient : public mld::services::IPayloadSource {
public:
    explicit HotStreakClient(const config::ApiSettings& api, std::ostream& log = std::cerr);

    std::vector<mld::domain::RawPayload> fetch_payloads() override;
    std::vector<mld::domain::CategoryInfo> fetch_categories() override;

    std::string search_request_body() const;
    std::string system_request_url() const;

protected:
    struct HttpReply {
        int status = 0;
        std::string body;
        std::string error;
    };

    virtual HttpReply post_graphql(const std::string& url, const std::string& body) const;
    virtual HttpReply get_graphql(const std::string& url) const;

    const config::ApiSettings& api() const noexcept { return api_; }

private:
    bool accept(const HttpReply& reply, const char* operation) const;

    config::ApiSettings api_;
    HotStreakResponseParser parser_;
    std::ostream& log_;
};

} // namespace mld::infrastructure
