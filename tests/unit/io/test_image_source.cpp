/**
 * @file test_image_source.cpp
 * @brief Unit tests for IO/ImageSource
 */

#include <gtest/gtest.h>
#include <VisMatch/IO/ImageSource.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Platform/FileIO.h>

#include "test_images.h"

#include <chrono>
#include <memory>
#include <thread>

using namespace Vis::Match;
using namespace Vis::Match::IO;

namespace {

class SlowSource : public ImageSource {
public:
    explicit SlowSource(int delayMs) : delayMs_(delayMs) {}

    Image Load(const std::string&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
        return Vis::Match::Test::SolidRgb(4, 4, 1, 2, 3);
    }

private:
    int delayMs_;
};

} // namespace

class ImageSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = Vis::Match::Test::TempDir();
        path_ = dir_ + "/source_red.png";
        ASSERT_TRUE(Vis::Match::Test::SolidRgb(12, 12, 255, 0, 0).SaveToFile(path_));
    }

    void TearDown() override {
        Platform::DeleteFile(path_);
    }

    std::string dir_;
    std::string path_;
};

// ============================================================================
// FileImageSource
// ============================================================================

TEST_F(ImageSourceTest, FileLoadsPlainPath) {
    FileImageSource source;
    Image img = source.Load(path_);
    EXPECT_EQ(img.Width(), 12);
    EXPECT_EQ(img.Height(), 12);
}

TEST_F(ImageSourceTest, FileLoadsFileUrl) {
    FileImageSource source;
    Image img = source.Load("file://" + path_);
    EXPECT_EQ(img.Width(), 12);
}

TEST_F(ImageSourceTest, FileResolvesRelativeToBase) {
    FileImageSource source(dir_);
    EXPECT_EQ(source.ResolvePath("source_red.png"), path_);
    EXPECT_EQ(source.ResolvePath("/abs/x.png"), "/abs/x.png");
    EXPECT_EQ(source.Load("source_red.png").Width(), 12);
}

TEST_F(ImageSourceTest, FileRejectsOtherSchemes) {
    FileImageSource source;
    EXPECT_THROW(source.Load("https://example.com/a.png"), DecodeException);
    EXPECT_THROW(source.Load("blob:abc"), DecodeException);
    EXPECT_THROW(source.Load(""), DecodeException);
}

TEST_F(ImageSourceTest, FileMissingThrowsDecode) {
    FileImageSource source;
    EXPECT_THROW(source.Load(dir_ + "/missing.png"), DecodeException);
}

// ============================================================================
// MemoryImageSource
// ============================================================================

TEST_F(ImageSourceTest, MemoryRegisterAndLoad) {
    MemoryImageSource source;
    std::string bytes;
    ASSERT_TRUE(Platform::ReadBinaryFile(path_, bytes));
    source.Register("blob:red", bytes);

    EXPECT_TRUE(source.Contains("blob:red"));
    EXPECT_EQ(source.Load("blob:red").Width(), 12);

    source.Unregister("blob:red");
    EXPECT_FALSE(source.Contains("blob:red"));
    EXPECT_THROW(source.Load("blob:red"), DecodeException);
}

TEST_F(ImageSourceTest, MemoryUndecodableThrows) {
    MemoryImageSource source;
    source.Register("blob:bad", "not an image");
    EXPECT_THROW(source.Load("blob:bad"), DecodeException);
}

// ============================================================================
// LoadImage
// ============================================================================

TEST_F(ImageSourceTest, LoadImageReturnsDecoded) {
    auto source = std::make_shared<FileImageSource>();
    Image img = LoadImage(source, path_, 5000);
    EXPECT_EQ(img.Width(), 12);
}

TEST_F(ImageSourceTest, LoadImagePropagatesDecodeError) {
    auto source = std::make_shared<FileImageSource>();
    EXPECT_THROW(LoadImage(source, dir_ + "/missing.png", 5000), DecodeException);
}

TEST_F(ImageSourceTest, LoadImageTimesOut) {
    auto source = std::make_shared<SlowSource>(300);
    EXPECT_THROW(LoadImage(source, "slow", 20), TimeoutException);
}

TEST_F(ImageSourceTest, LoadImageWaitsForFastEnoughSource) {
    auto source = std::make_shared<SlowSource>(5);
    EXPECT_EQ(LoadImage(source, "slow", 2000).Width(), 4);
}

TEST_F(ImageSourceTest, LoadImageValidatesArguments) {
    EXPECT_THROW(LoadImage(nullptr, path_, 100), InvalidArgumentException);
    auto source = std::make_shared<FileImageSource>();
    EXPECT_THROW(LoadImage(source, path_, 0), InvalidArgumentException);
}
