#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "store/artifact_store.hpp"
#include "testing.hpp"

#include <string>

namespace forge {
namespace {

class ArtifactStoreTest : public ::testing::Test {
  protected:
    void SetUp() override { ASSERT_TRUE(store.Init().is_ok()); }

    testutil::TemporaryDirectory tmp;
    ArtifactStore store{tmp.Sub("artifacts")};
};

TEST_F(ArtifactStoreTest, NamingConvention) {
    EXPECT_EQ(ArtifactStore::ArtifactFileName("b1"), "b1.bin");
    EXPECT_EQ(ArtifactStore::ManifestFileName("b1"), "b1_manifest.json");
}

TEST_F(ArtifactStoreTest, PutCopiesBinary) {
    const std::string src = tmp.Sub("firmware.bin");
    testutil::WriteTextFile(src, std::string(10000, '\x5a'));

    ArtifactRef ref;
    auto r = store.Put("b1", src, ref);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(ref.file, "b1.bin");
    EXPECT_EQ(ref.size, 10000u);
    EXPECT_EQ(ref.path, store.PathOf("b1.bin"));
    EXPECT_TRUE(store.Exists("b1.bin"));
    EXPECT_EQ(testutil::ReadTextFile(ref.path), testutil::ReadTextFile(src));
}

TEST_F(ArtifactStoreTest, PutIsWriteOnce) {
    const std::string first = tmp.Sub("first.bin");
    const std::string second = tmp.Sub("second.bin");
    testutil::WriteTextFile(first, "first");
    testutil::WriteTextFile(second, "second");

    ArtifactRef ref;
    ASSERT_TRUE(store.Put("b1", first, ref).is_ok());
    auto r = store.Put("b1", second, ref);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(testutil::ReadTextFile(store.PathOf("b1.bin")), "first");
}

TEST_F(ArtifactStoreTest, PutManifestIsWriteOnce) {
    std::string file;
    ASSERT_TRUE(store.PutManifest("b1", "{\"a\":1}", file).is_ok());
    EXPECT_EQ(file, "b1_manifest.json");
    EXPECT_EQ(testutil::ReadTextFile(store.PathOf(file)), "{\"a\":1}");

    auto r = store.PutManifest("b1", "{}", file);
    EXPECT_EQ(r.code, ErrorCode::PreconditionFailed);
}

TEST_F(ArtifactStoreTest, MissingSourceFails) {
    ArtifactRef ref;
    auto r = store.Put("b2", tmp.Sub("nope.bin"), ref);
    EXPECT_FALSE(r.is_ok());
    EXPECT_FALSE(store.Exists("b2.bin"));
}

TEST_F(ArtifactStoreTest, OpenArtifactStreamsContent) {
    const std::string src = tmp.Sub("fw.bin");
    testutil::WriteTextFile(src, "payload");
    ArtifactRef ref;
    ASSERT_TRUE(store.Put("b3", src, ref).is_ok());

    FileReader reader;
    ASSERT_TRUE(store.OpenArtifact("b3.bin", reader).is_ok());
    EXPECT_EQ(reader.TotalSize().value_or(0), 7u);
    EXPECT_EQ(Sha256Hex(reader), Sha256Hex(std::string("payload")));
}

TEST_F(ArtifactStoreTest, OpenMissingIsNotFound) {
    FileReader reader;
    auto r = store.OpenArtifact("ghost.bin", reader);
    EXPECT_EQ(r.code, ErrorCode::NotFound);
    EXPECT_FALSE(store.Exists(""));
}

TEST_F(ArtifactStoreTest, PathsStayInsideRoot) {
    EXPECT_EQ(store.PathOf("../../etc/passwd"), store.PathOf("passwd"));
    EXPECT_EQ(store.PathOf("../x.bin").rfind(store.Root(), 0), 0u);
}

} // namespace
} // namespace forge
