#include "network/TradeMessageParser.h"

#include <iostream>
#include <string>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

int main() {
    using quantpulse::network::TradeMessageParser;

    const long long fallback = 999;

    auto wrapped = TradeMessageParser::parse(
        std::string(R"({"stream":"btcusdt@aggTrade","data":{"e":"aggTrade","E":1700000000100,"s":"BTCUSDT","a":1,"p":"65000.10","q":"0.015","T":1700000000000,"m":true}})"),
        fallback);
    CHECK(wrapped.has_value(), "combined stream message should parse");
    CHECK(wrapped->instrument_id == "BTCUSDT", "symbol");
    CHECK(wrapped->price == 65000.10 && wrapped->quantity == 0.015, "price/quantity from strings");
    CHECK(wrapped->timestamp == 1700000000000LL, "trade time");

    auto raw = TradeMessageParser::parse(std::string(R"({"s":"ethusdt","p":3000.5,"q":2})"), fallback);
    CHECK(raw && raw->instrument_id == "ETHUSDT", "raw message, symbol upper-cased");
    CHECK(raw->timestamp == fallback, "missing T uses the fallback timestamp");

    CHECK(!TradeMessageParser::parse(std::string("not json"), fallback), "malformed JSON");
    CHECK(!TradeMessageParser::parse(std::string(R"([1,2,3])"), fallback), "non-object");
    CHECK(!TradeMessageParser::parse(std::string(R"({"result":null,"id":1})"), fallback), "subscription ack");
    CHECK(!TradeMessageParser::parse(std::string(R"({"s":"BTCUSDT","p":"abc","q":"1"})"), fallback), "non-numeric price");
    CHECK(!TradeMessageParser::parse(std::string(R"({"s":"BTCUSDT","p":"0","q":"1"})"), fallback), "zero price");
    CHECK(!TradeMessageParser::parse(std::string(R"({"s":"BTCUSDT","p":"10","q":"-1"})"), fallback), "negative quantity");
    CHECK(!TradeMessageParser::parse(std::string(R"({"s":"","p":"10","q":"1"})"), fallback), "empty symbol");
    CHECK(!TradeMessageParser::parse(std::string(R"({"s":"BTCUSDT","q":"1"})"), fallback), "missing price");

    CHECK(TradeMessageParser::streamName("BTCUSDT", "@aggTrade") == "btcusdt@aggTrade", "stream name");

    std::cout << "[TEST] TradeMessageParser PASSED\n";
    return 0;
}
