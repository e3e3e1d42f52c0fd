#include <gtest/gtest.h>
#include "medusa/core/router.hpp"
#include "medusa/proto/line.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace medusa;
using namespace std::chrono_literals;

class RouterTest : public ::testing::Test {
protected:
    std::shared_ptr<Store> store = std::make_shared<Store>();
    Router router{ store, 16, 32 };

    std::string run(const std::string& line) {
        std::vector<std::string> args;
        EXPECT_TRUE(tokenize(line, args)) << line;
        return router.dispatch(args).text;
    }

    static bool starts(const std::string& s, const std::string& p) { return s.rfind(p, 0) == 0; }
};

TEST_F(RouterTest, PingAndHelp) {
    EXPECT_EQ(run("PING"), "PONG\n");
    EXPECT_EQ(run("ping hello there"), "PONG hello there\n");
    auto help = run("HELP");
    EXPECT_TRUE(starts(help, "OK: Commands: "));
    EXPECT_NE(help.find("LRANGE"), std::string::npos);
}

TEST_F(RouterTest, CommandNamesAreCaseInsensitive) {
    EXPECT_EQ(run("set k v"), "OK: Set 'k' = 'v'\n");
    EXPECT_EQ(run("Get k"), "OK: 'k' = v\n");
}

TEST_F(RouterTest, BasicStringCommands) {
    EXPECT_EQ(run("SET test_key test_value"), "OK: Set 'test_key' = 'test_value'\n");
    EXPECT_EQ(run("GET test_key"), "OK: 'test_key' = test_value\n");
    EXPECT_EQ(run("EXISTS test_key"), "TRUE: Key 'test_key' exists\n");
    EXPECT_EQ(run("DELETE test_key"), "OK: Deleted 'test_key' (was 'test_value')\n");
    EXPECT_EQ(run("GET test_key"), "NULL: Key 'test_key' not found\n");
    EXPECT_EQ(run("DEL test_key"), "NULL: Key 'test_key' not found\n");
    EXPECT_EQ(run("EXISTS test_key"), "FALSE: Key 'test_key' does not exist\n");
}

TEST_F(RouterTest, QuotedValuesKeepSpaces) {
    run("SET greeting \"hello world\"");
    EXPECT_EQ(store->get("greeting"), "hello world");
}

TEST_F(RouterTest, SetWithTtl) {
    EXPECT_EQ(run("SET ttl_key ttl_value 10"), "OK: Set 'ttl_key' = 'ttl_value' (expires in 10s)\n");
    auto reply = run("TTL ttl_key");
    EXPECT_TRUE(starts(reply, "OK: 'ttl_key' expires in ")) << reply;
    EXPECT_TRUE(starts(run("SET k v abc"), "ERROR: 'abc' is not a valid integer"));
    EXPECT_TRUE(starts(run("SET k v -5"), "ERROR: TTL must be a non-negative"));
}

TEST_F(RouterTest, TtlStates) {
    EXPECT_EQ(run("TTL nope"), "NULL: Key 'nope' not found\n");
    run("SET plain v");
    EXPECT_EQ(run("TTL plain"), "OK: 'plain' has no expiration\n");
    store->set_with_ttl("gone", "v", 0);
    EXPECT_EQ(run("TTL gone"), "OK: 'gone' has expired\n");
    EXPECT_EQ(run("TTL gone"), "NULL: Key 'gone' not found\n");
}

TEST_F(RouterTest, ExpireAndPersist) {
    EXPECT_EQ(run("EXPIRE nope 5"), "NULL: Key 'nope' not found\n");
    run("SET a 1");
    EXPECT_EQ(run("EXPIRE a 5"), "OK: 'a' expires in 5s\n");
    EXPECT_EQ(run("PERSIST a"), "OK: Removed expiration from 'a'\n");
    EXPECT_TRUE(starts(run("PERSIST a"), "NULL: "));
    EXPECT_TRUE(starts(run("EXPIRE a soon"), "ERROR: "));
}

TEST_F(RouterTest, ExpiredKeyIsGoneAfterSleep) {
    run("SET a 1");
    run("EXPIRE a 1");
    std::this_thread::sleep_for(1100ms);
    EXPECT_EQ(run("GET a"), "NULL: Key 'a' not found\n");
}

TEST_F(RouterTest, TypeCommand) {
    run("SET s v");
    run("HSET h f v");
    run("LPUSH l v");
    EXPECT_EQ(run("TYPE s"), "OK: 's' is a string\n");
    EXPECT_EQ(run("TYPE h"), "OK: 'h' is a hash\n");
    EXPECT_EQ(run("TYPE l"), "OK: 'l' is a list\n");
    EXPECT_EQ(run("TYPE x"), "OK: 'x' is a none\n");
}

TEST_F(RouterTest, KeySpaceCommands) {
    EXPECT_EQ(run("LIST"), "OK: No keys found\n");
    run("SET user:1 john");
    run("SET user:2 jane");
    run("SET product:1 laptop");
    EXPECT_EQ(run("KEYS user:*"), "OK: Keys: user:1, user:2\n");
    EXPECT_EQ(run("LIST"), "OK: Keys: product:1, user:1, user:2\n");
    EXPECT_EQ(run("COUNT"), "OK: 3 entries\n");
    EXPECT_EQ(run("KEYS none:*"), "OK: No keys found\n");
    EXPECT_EQ(run("CLEAR"), "OK: All entries cleared\n");
    EXPECT_EQ(run("COUNT"), "OK: 0 entries\n");
}

TEST_F(RouterTest, InfoIsOneLine) {
    run("SET a 1");
    auto info = run("INFO");
    EXPECT_TRUE(starts(info, "OK: # Server | medusa_version:"));
    EXPECT_NE(info.find("total_keys:1"), std::string::npos);
    EXPECT_EQ(info.find('\n'), info.size() - 1);
}

TEST_F(RouterTest, HashCommands) {
    EXPECT_EQ(run("HSET user:1 name John"), "OK: Created field 'name'\n");
    EXPECT_EQ(run("HSET user:1 name Johnny"), "OK: Updated field 'name'\n");
    run("HSET user:1 age 30");
    EXPECT_EQ(run("HGET user:1 name"), "OK: 'user:1'.'name' = Johnny\n");
    EXPECT_EQ(run("HGETALL user:1"), "OK: {age: 30, name: Johnny}\n");
    EXPECT_EQ(run("HLEN user:1"), "OK: 2 fields\n");
    EXPECT_EQ(run("HEXISTS user:1 age"), "TRUE: Field 'age' exists in 'user:1'\n");
    EXPECT_EQ(run("HDEL user:1 age"), "OK: Deleted field 'age'\n");
    EXPECT_TRUE(starts(run("HDEL user:1 age"), "NULL: "));
    EXPECT_TRUE(starts(run("HGET user:1 age"), "NULL: "));
    EXPECT_TRUE(starts(run("HEXISTS user:1 age"), "FALSE: "));
    EXPECT_EQ(run("HGETALL missing"), "OK: {}\n");
    EXPECT_EQ(run("DELETE user:1"), "OK: Deleted 'user:1' (was {name: Johnny})\n");
}

TEST_F(RouterTest, ListCommands) {
    EXPECT_EQ(run("LPUSH tasks review"), "OK: List length 1\n");
    EXPECT_EQ(run("LPUSH tasks complete"), "OK: List length 2\n");
    EXPECT_EQ(run("RPUSH tasks test"), "OK: List length 3\n");
    EXPECT_EQ(run("LLEN tasks"), "OK: 3 items\n");
    EXPECT_EQ(run("LRANGE tasks 0 -1"), "OK: [complete, review, test]\n");
    EXPECT_EQ(run("LRANGE tasks -1 -1"), "OK: [test]\n");
    EXPECT_EQ(run("LRANGE missing 0 -1"), "OK: []\n");
    EXPECT_TRUE(starts(run("LRANGE tasks x 1"), "ERROR: 'x' is not a valid integer"));
    EXPECT_EQ(run("LPOP tasks"), "OK: complete\n");
    EXPECT_EQ(run("RPOP tasks"), "OK: test\n");
    EXPECT_EQ(run("DELETE tasks"), "OK: Deleted 'tasks' (was [review])\n");
    EXPECT_EQ(run("LPOP tasks"), "NULL: List 'tasks' is empty\n");
}

TEST_F(RouterTest, TypeConflictsAreRejected) {
    run("SET string_key hello");
    auto r = run("HSET string_key field value");
    EXPECT_TRUE(starts(r, "ERROR: WRONGTYPE")) << r;
    EXPECT_TRUE(starts(run("LPUSH string_key item"), "ERROR: WRONGTYPE"));
    run("HSET h f v");
    EXPECT_TRUE(starts(run("GET h"), "ERROR: WRONGTYPE"));
    EXPECT_EQ(run("GET string_key"), "OK: 'string_key' = hello\n");
}

TEST_F(RouterTest, ArityAndUnknownCommands) {
    EXPECT_EQ(run("GET"), "ERROR: GET requires a key (GET key)\n");
    EXPECT_EQ(run("SET k"), "ERROR: SET requires key and value (SET key value [ttl])\n");
    EXPECT_TRUE(starts(run("HSET k f"), "ERROR: HSET requires"));
    EXPECT_TRUE(starts(run("LRANGE k 0"), "ERROR: LRANGE requires"));
    EXPECT_EQ(run("FLY away"), "ERROR: Unknown command 'FLY'\n");
    EXPECT_EQ(router.dispatch({}).text, "ERROR: Empty command\n");
}

TEST_F(RouterTest, BoundaryLimits) {
    EXPECT_EQ(run("SET \"\" v"), "ERROR: key must not be empty\n");
    EXPECT_EQ(run("SET aaaaaaaaaaaaaaaaa v"), "ERROR: key exceeds 16 bytes\n");
    EXPECT_EQ(run("SET k " + std::string(33, 'x')), "ERROR: value exceeds 32 bytes\n");
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(RouterTest, QuitRequestsClose) {
    auto r = router.dispatch({ "quit" });
    EXPECT_EQ(r.text, "OK: Goodbye!\n");
    EXPECT_TRUE(r.close);
    EXPECT_TRUE(router.dispatch({ "EXIT" }).close);
    EXPECT_FALSE(router.dispatch({ "PING" }).close);
}
