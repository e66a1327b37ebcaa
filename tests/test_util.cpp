#include "binance/client_base.hpp"
#include "binance/futures_client.hpp"
#include "binance/market_stream.hpp"
#include "binance/util.hpp"
#include "binance/ws_client.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

TEST_CASE("url_encode handles safe and unsafe characters") {
    using binance::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("symbols-_.~") == "symbols-_.~");
}

TEST_CASE("filter_empty removes empty values") {
    using binance::filter_empty;
    binance::QueryParams params = {
        {"key1", "value"},
        {"key2", ""},
        {"key3", "0"},
        {"key4", "false"}
    };

    const auto filtered = filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "key1");
    CHECK(filtered[1].first == "key3");
    CHECK(filtered[2].first == "key4");
}

TEST_CASE("build_query_string preserves order and encodes values") {
    using binance::build_query_string;
    binance::QueryParams params = {
        {"symbol", "XRPUSDC"},
        {"positionSide", "LONG"},
        {"note", "space value"}
    };

    CHECK(build_query_string(params) == "symbol=XRPUSDC&positionSide=LONG&note=space%20value");
}

TEST_CASE("case conversion copies") {
    CHECK(binance::to_upper_copy("xrpUSDC") == "XRPUSDC");
    CHECK(binance::to_lower_copy("XRPUSDC") == "xrpusdc");
}

TEST_CASE("precision follows the exchange step") {
    CHECK(binance::precision_from_step(0.0001) == 4);
    CHECK(binance::precision_from_step(0.1) == 1);
    CHECK(binance::precision_from_step(1.0) == 0);
    CHECK(binance::precision_from_step(0.0) == 0);
}

TEST_CASE("step rounding") {
    CHECK(binance::round_to_step(0.52346, 0.0001) == Catch::Approx(0.5235));
    CHECK(binance::floor_to_step(3.99, 0.1) == Catch::Approx(3.9));
    CHECK(binance::floor_to_step(0.3, 0.1) == Catch::Approx(0.3));
    CHECK(binance::round_to_step(1.2345, 0.0) == Catch::Approx(1.2345));
}

TEST_CASE("format_decimal pads to fixed precision") {
    CHECK(binance::format_decimal(0.5, 4) == "0.5000");
    CHECK(binance::format_decimal(3.0, 0) == "3");
}

TEST_CASE("hmac_sha256_hex matches the documented request signature") {
    const std::string secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
    const std::string query =
        "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1&recvWindow=5000&timestamp=1499827319559";
    CHECK(binance::hmac_sha256_hex(secret, query) ==
          "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
}

TEST_CASE("subscribe message lists every stream") {
    const auto message = binance::build_subscribe_message({"xrpusdc@bookTicker", "xrpusdc@kline_1h"}, 7);
    const auto json = nlohmann::json::parse(message);
    CHECK(json["method"] == "SUBSCRIBE");
    CHECK(json["id"] == 7);
    REQUIRE(json["params"].size() == 2);
    CHECK(json["params"][0] == "xrpusdc@bookTicker");
    CHECK(json["params"][1] == "xrpusdc@kline_1h");
}

TEST_CASE("parse_ws_url splits scheme, host, port and path") {
    binance::WsEndpoint endpoint;
    REQUIRE(binance::parse_ws_url("wss://fstream.binance.com/ws", endpoint));
    CHECK(endpoint.ssl);
    CHECK(endpoint.host == "fstream.binance.com");
    CHECK(endpoint.port == 443);
    CHECK(endpoint.path == "/ws");

    REQUIRE(binance::parse_ws_url("ws://localhost:9001", endpoint));
    CHECK_FALSE(endpoint.ssl);
    CHECK(endpoint.host == "localhost");
    CHECK(endpoint.port == 9001);
    CHECK(endpoint.path == "/");

    CHECK_FALSE(binance::parse_ws_url("https://fapi.binance.com", endpoint));
}

TEST_CASE("an idle market stream reports no connection history") {
    binance::MarketStream stream{"wss://fstream.binance.com/ws"};
    CHECK_FALSE(stream.is_connected());
    CHECK(stream.reconnect_count() == 0);
}

TEST_CASE("a client without requests has no weight reading") {
    binance::FuturesClient client{binance::Credentials{}};
    CHECK_FALSE(client.last_used_weight());
    CHECK_FALSE(client.has_credentials());
}
