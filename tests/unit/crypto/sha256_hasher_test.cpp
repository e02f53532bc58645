#include <gtest/gtest.h>

#include <omc/crypto/hasher.h>

#include <span>
#include <string>
#include <vector>

using omc::crypto::SHA256Hasher;

TEST(SHA256HasherTest, KnownDigests) {
    EXPECT_EQ(SHA256Hasher::hash(std::string_view("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SHA256Hasher::hash(std::string_view("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256HasherTest, IncrementalMatchesOneShot) {
    SHA256Hasher hasher;
    hasher.update(std::string_view("a"));
    hasher.update(std::string_view("bc"));
    EXPECT_EQ(hasher.finalize(), SHA256Hasher::hash(std::string_view("abc")));
}

TEST(SHA256HasherTest, FinalizeResets) {
    SHA256Hasher hasher;
    hasher.update(std::string_view("abc"));
    auto first = hasher.finalize();
    hasher.update(std::string_view("abc"));
    EXPECT_EQ(hasher.finalize(), first);
}

TEST(SHA256HasherTest, FloatVectorsHashByValue) {
    std::vector<float> a{0.1f, 0.2f, 0.3f};
    std::vector<float> b{0.1f, 0.2f, 0.3f};
    std::vector<float> c{0.1f, 0.2f, 0.30001f};

    SHA256Hasher h;
    h.update(std::span<const float>(a));
    auto ha = h.finalize();
    h.update(std::span<const float>(b));
    auto hb = h.finalize();
    h.update(std::span<const float>(c));
    auto hc = h.finalize();

    EXPECT_EQ(ha, hb);
    EXPECT_NE(ha, hc);
    EXPECT_EQ(ha.size(), 64u);
}
