#include "strata/fingerprint.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace strata;
using namespace strata::testing;

class FingerprintTest : public ::testing::Test {
protected:
    void SetUp() override {
        files.set("src/main.c", "int main() { return 0; }");
        files.set("package.lock", "left-pad 1.0.0");
    }

    static Stage stage(std::string command, std::vector<InputDecl> inputs = {}, std::optional<size_t> parent = {}) {
        return Stage{"stage", parent, {std::move(command)}, true, std::move(inputs)};
    }

    Fingerprint fp(const Stage &s,
                   const std::optional<Fingerprint> &parent = std::nullopt,
                   const Artifact *parent_artifact = nullptr) {
        auto res = fingerprinter.fingerprint(s, parent, parent_artifact);
        EXPECT_TRUE(res.has_value()) << res.error().describe();
        return res.value_or(Fingerprint{});
    }

    MapFileAccess files;
    Fingerprinter fingerprinter{files};
};

TEST(DigestTest, MatchesKnownSha256) {
    EXPECT_EQ(digest("abc").to_hex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digest("").to_hex(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, HexParsing) {
    Fingerprint fp = digest("abc");
    auto parsed = Fingerprint::from_hex(fp.to_hex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, fp);

    EXPECT_FALSE(Fingerprint::from_hex("abc").has_value());
    EXPECT_FALSE(Fingerprint::from_hex(std::string(64, 'g')).has_value());
    EXPECT_FALSE(Fingerprint::from_hex(std::string(64, 'A')).has_value());
}

TEST_F(FingerprintTest, Deterministic) {
    Stage s = stage("cc -c src/main.c", {file_input("src/main.c"), text_input("-O2")});
    Fingerprint first = fp(s);
    EXPECT_EQ(fp(s), first);

    Fingerprinter other{files};
    EXPECT_EQ(other.fingerprint(s, std::nullopt).value(), first);
}

TEST_F(FingerprintTest, StageNameIsNotPartOfTheKey) {
    Stage a = stage("make");
    Stage b = stage("make");
    b.name = "renamed";
    EXPECT_EQ(fp(a), fp(b));
}

TEST_F(FingerprintTest, CommandChangesKey) {
    EXPECT_NE(fp(stage("make all")), fp(stage("make test")));
}

TEST_F(FingerprintTest, ShellFlagChangesKey) {
    Stage shell = stage("make");
    Stage direct = stage("make");
    direct.shell = false;
    EXPECT_NE(fp(shell), fp(direct));
}

TEST_F(FingerprintTest, CommandTextInputChangesKey) {
    EXPECT_NE(fp(stage("make", {text_input("srcHash v1")})), fp(stage("make", {text_input("srcHash v2")})));
}

TEST_F(FingerprintTest, InputOrderMatters) {
    Stage ab = stage("make", {text_input("a"), text_input("b")});
    Stage ba = stage("make", {text_input("b"), text_input("a")});
    EXPECT_NE(fp(ab), fp(ba));
}

TEST_F(FingerprintTest, InputBoundariesAreUnambiguous) {
    Stage split_late = stage("make", {text_input("ab"), text_input("c")});
    Stage split_early = stage("make", {text_input("a"), text_input("bc")});
    EXPECT_NE(fp(split_late), fp(split_early));

    Stage args_a{"stage", std::nullopt, {"echo", "a b"}, false, {}};
    Stage args_b{"stage", std::nullopt, {"echo a", "b"}, false, {}};
    EXPECT_NE(fp(args_a), fp(args_b));
}

TEST_F(FingerprintTest, InputKindChangesKey) {
    files.set("v1", "v1");
    EXPECT_NE(fp(stage("make", {text_input("v1")})), fp(stage("make", {file_input("v1")})));
}

TEST_F(FingerprintTest, FileContentChangesKey) {
    Stage s = stage("npm ci", {file_input("package.lock")});
    Fingerprint before = fp(s);

    files.set("package.lock", "left-pad 1.0.1");
    EXPECT_NE(fp(s), before);

    files.set("package.lock", "left-pad 1.0.0");
    EXPECT_EQ(fp(s), before);
}

TEST_F(FingerprintTest, UnreadableFileFails) {
    auto res = fingerprinter.fingerprint(stage("make", {file_input("missing.txt")}), std::nullopt);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::UnreadableInput);
    EXPECT_NE(res.error().message.find("missing.txt"), std::string::npos);
}

TEST_F(FingerprintTest, ParentFingerprintChangesKey) {
    Stage child = stage("make", {}, 0);
    EXPECT_NE(fp(child, digest("parent one")), fp(child, digest("parent two")));
}

TEST_F(FingerprintTest, RootDiffersFromZeroParent) {
    Stage root = stage("make");
    Stage child = stage("make", {}, 0);
    EXPECT_NE(fp(root), fp(child, Fingerprint{}));
}

TEST_F(FingerprintTest, ParentArtifactInputHashesPayload) {
    Stage child = stage("package", {parent_input()}, 0);
    Fingerprint parent = digest("compile");

    Artifact first;
    first.payload = "object code v1";
    Artifact second;
    second.payload = "object code v2";

    EXPECT_NE(fp(child, parent, &first), fp(child, parent, &second));

    Artifact same_payload = first;
    same_payload.stage = "other";
    same_payload.created = {};
    EXPECT_EQ(fp(child, parent, &first), fp(child, parent, &same_payload));
}

TEST_F(FingerprintTest, ParentArtifactInputWithoutArtifactFails) {
    Stage child = stage("package", {parent_input()}, 0);
    auto res = fingerprinter.fingerprint(child, digest("compile"), nullptr);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::UnreadableInput);

    Artifact artifact;
    auto root = fingerprinter.fingerprint(stage("package", {parent_input()}), std::nullopt, &artifact);
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ErrorCode::UnreadableInput);
}
