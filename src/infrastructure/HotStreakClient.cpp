#include "infrastructure/HotStreakClient.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <nlohmann/json.hpp>

namespace mld::infrastructure {

namespace {

constexpr const char* kSearchQuery =
    "query search($query: String, $page: Int, $filters: SearchFilterInput) {"
    " search(query: $query, page: $page, filters: $filters) {"
    " results { markets64 participant { player { firstName fullName } } } } }";

constexpr const char* kSystemQuery =
    "query system { system { __typename sports { __typename id name"
    " categories { __typename id groupName name ordinality } } } }";

ix::HttpRequestArgsPtr make_args(ix::HttpClient& client, const config::ApiSettings& api) {
    auto args = client.createRequest();
    args->connectTimeout = api.connect_timeout_seconds;
    args->transferTimeout = api.transfer_timeout_seconds;
    args->extraHeaders["accept"] = "application/graphql-response+json, application/json";
    args->extraHeaders["x-hs3-version"] = "2";
    args->extraHeaders["x-requested-with"] = "web";
    if (!api.id_token.empty()) {
        args->extraHeaders["privy-id-token"] = api.id_token;
    }
    return args;
}

} // anonymous namespace

HotStreakClient::HotStreakClient(const config::ApiSettings& api, std::ostream& log)
    : api_(api), log_(log) {}

std::string HotStreakClient::search_request_body() const {
    nlohmann::json payload;
    payload["query"] = kSearchQuery;
    payload["operationName"] = "search";
    payload["variables"]["filters"]["activeMarketsOnly"] = true;
    payload["variables"]["filters"]["sport"] = api_.sport_id;
    return payload.dump();
}

std::string HotStreakClient::system_request_url() const {
    ix::HttpClient client;
    return api_.graphql_url +
        "?query=" + client.urlEncode(kSystemQuery) +
        "&variables=" + client.urlEncode("{}") +
        "&operationName=system";
}

std::vector<mld::domain::RawPayload> HotStreakClient::fetch_payloads() {
    auto reply = post_graphql(api_.graphql_url, search_request_body());
    if (!accept(reply, "search")) return {};

    auto payloads = parser_.parse_search(reply.body);
    log_ << "[fetch] search returned " << payloads.size() << " payloads" << std::endl;
    return payloads;
}

std::vector<mld::domain::CategoryInfo> HotStreakClient::fetch_categories() {
    auto reply = get_graphql(system_request_url());
    if (!accept(reply, "system")) return {};

    auto categories = parser_.parse_system(reply.body);
    log_ << "[fetch] system returned " << categories.size() << " categories" << std::endl;
    return categories;
}

HotStreakClient::HttpReply HotStreakClient::post_graphql(const std::string& url,
                                                        const std::string& body) const {
    ix::HttpClient client;
    auto args = make_args(client, api_);
    args->extraHeaders["Content-Type"] = "application/json";

    auto response = client.post(url, body, args);
    return HttpReply{response->statusCode, response->body, response->errorMsg};
}

HotStreakClient::HttpReply HotStreakClient::get_graphql(const std::string& url) const {
    ix::HttpClient client;
    auto args = make_args(client, api_);

    auto response = client.get(url, args);
    return HttpReply{response->statusCode, response->body, response->errorMsg};
}

bool HotStreakClient::accept(const HttpReply& reply, const char* operation) const {
    if (reply.status == 200) return true;

    log_ << "[fetch] " << operation << " failed: status=" << reply.status;
    if (!reply.error.empty()) {
        log_ << " error=" << reply.error;
    }
    log_ << std::endl;
    return false;
}

} // namespace mld::infrastructure
