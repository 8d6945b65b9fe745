#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/config_manager.hpp"
#include "eks/foundation/error_code.hpp"
#include "eks/foundation/service_error.hpp"
#include "eks/foundation/service_result.hpp"
#include "eks/foundation/types.hpp"

using namespace eks::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotFound), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ListenFailed), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConstraintViolation), "Database");
    EXPECT_EQ(errorSubsystem(ErrorCode::DecryptFailed), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::ChallengeExpired), "Challenge");
    EXPECT_EQ(errorSubsystem(ErrorCode::NameTaken), "Registry");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, UnknownRange) {
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0xFF00)), "Unknown");
}

// --- ServiceError tests ---

TEST(ServiceErrorTest, DefaultConstruction) {
    ServiceError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(ServiceErrorTest, CodeAndMessage) {
    ServiceError err(ErrorCode::KeyNotFound, "no key for alice");
    EXPECT_EQ(err.code(), ErrorCode::KeyNotFound);
    EXPECT_EQ(err.message(), "no key for alice");
    EXPECT_EQ(err.subsystem(), "Registry");
    EXPECT_FALSE(err.isSuccess());
}

TEST(ServiceErrorTest, WithContext) {
    struct Offending {
        std::string name;
    };
    ServiceError err(ErrorCode::InvalidName, "bad name", Offending{"a\nb"});
    EXPECT_TRUE(err.hasContext());
    auto* info = err.context<Offending>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->name, "a\nb");

    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(ServiceErrorTest, SuccessCheck) {
    ServiceError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- ServiceResult tests ---

TEST(ServiceResultTest, OkValue) {
    auto result = ServiceResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(ServiceResultTest, ErrorValue) {
    auto result = ServiceResult<int>::err(
        ServiceError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(ServiceResultTest, VoidOk) {
    auto result = ServiceResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(ServiceResultTest, VoidError) {
    auto result = ServiceResult<void>::err(ServiceError(ErrorCode::Timeout, "timed out"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
}

// --- KeyId tests ---

TEST(KeyIdTest, DefaultInvalid) {
    KeyId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0);
}

TEST(KeyIdTest, ExplicitConstruction) {
    KeyId id(100);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 100);
}

TEST(KeyIdTest, NegativeIsInvalid) {
    EXPECT_FALSE(KeyId(-1).isValid());
}

TEST(KeyIdTest, EqualityAndOrdering) {
    KeyId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(KeyIdTest, HashWorks) {
    std::unordered_set<KeyId> ids{KeyId(1), KeyId(2), KeyId(1)};
    EXPECT_EQ(ids.size(), 2u);
}

// --- Hex helpers ---

TEST(HexTest, EncodesLowerCase) {
    EXPECT_EQ(toHex(Bytes{0x00, 0xAB, 0x7f, 0xff}), "00ab7fff");
    EXPECT_EQ(toHex(Bytes{}), "");
}

TEST(HexTest, DecodesEitherCase) {
    auto decoded = fromHex("00AbFf");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (Bytes{0x00, 0xAB, 0xFF}));
}

TEST(HexTest, RejectsOddLength) {
    EXPECT_FALSE(fromHex("abc").has_value());
}

TEST(HexTest, RejectsNonHexDigit) {
    EXPECT_FALSE(fromHex("zz").has_value());
    EXPECT_FALSE(fromHex("0x").has_value());
}

TEST(HexTest, ToBytesCopiesText) {
    EXPECT_EQ(toBytes("ab"), (Bytes{'a', 'b'}));
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel does not collide.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("eks_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("keyserver.yaml", R"(
server:
  port: 3030
  bind_address: "127.0.0.1"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto port = config.get<int>("server.port");
    ASSERT_TRUE(port.hasValue());
    EXPECT_EQ(port.value(), 3030);

    auto addr = config.get<std::string>("server.bind_address");
    ASSERT_TRUE(addr.hasValue());
    EXPECT_EQ(addr.value(), "127.0.0.1");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("server:\n  port: nope\n").hasValue());

    auto missing = config.getOr<int>("server.workers", 4);
    ASSERT_TRUE(missing.hasValue());
    EXPECT_EQ(missing.value(), 4);

    auto wrongType = config.getOr<int>("server.port", 3030);
    ASSERT_TRUE(wrongType.hasError());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("server: [unclosed");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonScalarMapKeyIsLoadError) {
    ConfigManager config;
    auto result = config.loadFromString("server:\n  ? [a, b]\n  : 1\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("server:\n  port: 3030\n").hasValue());

    auto path = writeYaml("bad_key.yaml", "server:\n  ? {x: 1}\n  : 2\n");
    EXPECT_TRUE(config.load(path).hasError());

    auto port = config.get<int>("server.port");
    ASSERT_TRUE(port.hasValue());
    EXPECT_EQ(port.value(), 3030);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("server.port", 9090);

    auto result = config.get<int>("server.port");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9090);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "database:\n  path: keys.sqlite\n");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("database.path"));
    EXPECT_FALSE(config.hasKey("database"));
    EXPECT_FALSE(config.hasKey("missing"));
}
