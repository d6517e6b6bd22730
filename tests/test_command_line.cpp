#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "command_line.hpp"

TEST_CASE("parse_param") {
    CHECK(parse_param("42").get<int>() == 42);
    CHECK(parse_param("true").get<bool>() == true);
    CHECK(parse_param("null").is_null());
    CHECK(parse_param("[1,2]").size() == 2);
    CHECK(parse_param(R"({"a":1})").is_object());
    CHECK(parse_param("abc").get<std::string>() == "abc");
    CHECK(parse_param("0000000000000000000abc").get<std::string>() == "0000000000000000000abc");

    const json amount = parse_param("0.00000001");
    REQUIRE(amount.is_decimal());
    CHECK(amount.dump() == "0.00000001");
}

TEST_CASE("parse_command splits method and params") {
    auto cmd = parse_command("  getblock   \"00000000abc\"  2 ");
    CHECK(cmd.method == "getblock");
    REQUIRE(cmd.params.size() == 2);
    CHECK(cmd.params[0].get<std::string>() == "00000000abc");
    CHECK(cmd.params[1].get<int>() == 2);
}

TEST_CASE("quoting") {
    SECTION("single quotes are literal") {
        auto cmd = parse_command(R"(sendmany '' '{"addr":0.1}')");
        REQUIRE(cmd.params.size() == 2);
        CHECK(cmd.params[0].get<std::string>().empty());
        REQUIRE(cmd.params[1].is_object());
        CHECK(cmd.params[1]["addr"].is_decimal());
    }
    SECTION("double quotes honour escapes") {
        auto cmd = parse_command(R"(echo "a \"b\" c\\d")");
        REQUIRE(cmd.params.size() == 1);
        CHECK(cmd.params[0].get<std::string>() == R"(a "b" c\d)");
    }
    SECTION("quoted semicolon does not split") {
        auto cmd = parse_command("echo 'a;b'");
        CHECK(cmd.params[0].get<std::string>() == "a;b");
    }
}

TEST_CASE("parse_command errors") {
    CHECK_THROWS_AS(parse_command(""), std::invalid_argument);
    CHECK_THROWS_AS(parse_command("   "), std::invalid_argument);
    CHECK_THROWS_AS(parse_command("echo 'open"), std::invalid_argument);
    CHECK_THROWS_AS(parse_command("getinfo; getblockcount"), std::invalid_argument);
}

TEST_CASE("parse_commands") {
    auto cmds = parse_commands("getblockcount; getblockhash 0 ;; getbestblockhash;");
    REQUIRE(cmds.size() == 3);
    CHECK(cmds[0].method == "getblockcount");
    CHECK(cmds[0].params.empty());
    CHECK(cmds[1].method == "getblockhash");
    CHECK(cmds[1].params[0].get<int>() == 0);
    CHECK(cmds[2].method == "getbestblockhash");

    CHECK(parse_commands(" ; ").empty());
}

TEST_CASE("batch_entry") {
    auto entry = parse_command("getblock abc 2").batch_entry();
    REQUIRE(entry.size() == 3);
    CHECK(entry[0].get<std::string>() == "getblock");
    CHECK(entry[1].get<std::string>() == "abc");
    CHECK(entry[2].get<int>() == 2);
}

TEST_CASE("resolve_method walks dotted names") {
    AuthServiceProxy root("http://u:p@127.0.0.1:8332/");
    CHECK(*resolve_method(root, "getinfo").service_name() == "getinfo");
    CHECK(*resolve_method(root, "wallet.getbalance").service_name() == "wallet.getbalance");
    CHECK_THROWS_AS(resolve_method(root, "a..b"), std::out_of_range);
    CHECK_THROWS_AS(resolve_method(root, "__len__"), std::out_of_range);
}
