#include <VisMatch/Core/Image.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Platform/Memory.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <vector>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Vis::Match {

// =============================================================================
// Implementation class
// =============================================================================

class Image::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    PixelType type_ = PixelType::UInt8;
    ChannelType channelType_ = ChannelType::Gray;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t BytesPerPixel() const {
        size_t channelSize = 1;
        switch (type_) {
            case PixelType::UInt8: channelSize = 1; break;
            case PixelType::UInt16:
            case PixelType::Int16: channelSize = 2; break;
            case PixelType::Float32: channelSize = 4; break;
        }

        int numChannels = 1;
        switch (channelType_) {
            case ChannelType::Gray: numChannels = 1; break;
            case ChannelType::RGB:
            case ChannelType::BGR: numChannels = 3; break;
            case ChannelType::RGBA:
            case ChannelType::BGRA: numChannels = 4; break;
        }

        return channelSize * numChannels;
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;

        size_t bpp = BytesPerPixel();
        stride_ = Platform::AlignedSize(w * bpp, MEMORY_ALIGNMENT);
        data_ = Platform::AllocatePixelBuffer(stride_ * h);
    }
};

namespace {

// Takes ownership of an stb pixel buffer and copies it into a fresh Image
Image AdoptDecoded(uint8_t* data, int w, int h, int channels, const std::string& what) {
    ChannelType channelType = ChannelType::Gray;
    switch (channels) {
        case 1: channelType = ChannelType::Gray; break;
        case 2: {
            // Gray+alpha has no ChannelType of its own; widen to RGBA
            Image img(w, h, PixelType::UInt8, ChannelType::RGBA);
            for (int y = 0; y < h; ++y) {
                const uint8_t* src = data + static_cast<size_t>(y) * w * 2;
                uint8_t* dst = static_cast<uint8_t*>(img.RowPtr(y));
                for (int x = 0; x < w; ++x) {
                    dst[x * 4 + 0] = src[x * 2];
                    dst[x * 4 + 1] = src[x * 2];
                    dst[x * 4 + 2] = src[x * 2];
                    dst[x * 4 + 3] = src[x * 2 + 1];
                }
            }
            stbi_image_free(data);
            return img;
        }
        case 3: channelType = ChannelType::RGB; break;
        case 4: channelType = ChannelType::RGBA; break;
        default:
            stbi_image_free(data);
            throw DecodeException("Unsupported channel count " +
                                  std::to_string(channels) + " in " + what);
    }

    Image img = Image::FromData(data, w, h, PixelType::UInt8, channelType);
    stbi_image_free(data);
    return img;
}

} // namespace

// =============================================================================
// Constructors
// =============================================================================

Image::Image() : impl_(std::make_shared<Impl>()) {}

Image::Image(int32_t width, int32_t height, PixelType type, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }

    impl_->type_ = type;
    impl_->channelType_ = channels;
    impl_->Allocate(width, height);
}

Image::Image(const Image& other) = default;
Image::Image(Image&& other) noexcept = default;
Image::~Image() = default;
Image& Image::operator=(const Image& other) = default;
Image& Image::operator=(Image&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

Image Image::FromFile(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    uint8_t* data = stbi_load(path.c_str(), &w, &h, &channels, 0);

    if (!data) {
        const char* reason = stbi_failure_reason();
        throw DecodeException("Failed to load image: " + path +
                              (reason ? std::string(" (") + reason + ")" : std::string()));
    }

    return AdoptDecoded(data, w, h, channels, path);
}

Image Image::FromMemory(const void* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw DecodeException("Empty image buffer");
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        throw DecodeException("Image buffer too large");
    }

    int w = 0, h = 0, channels = 0;
    uint8_t* pixels = stbi_load_from_memory(static_cast<const stbi_uc*>(data),
                                            static_cast<int>(size),
                                            &w, &h, &channels, 0);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw DecodeException(std::string("Failed to decode image buffer") +
                              (reason ? std::string(" (") + reason + ")" : std::string()));
    }

    return AdoptDecoded(pixels, w, h, channels, "memory buffer");
}

Image Image::FromData(const void* data, int32_t width, int32_t height,
                      PixelType type, ChannelType channels) {
    Image img(width, height, type, channels);

    size_t bpp = img.impl_->BytesPerPixel();
    size_t srcStride = width * bpp;

    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), src + y * srcStride, srcStride);
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t Image::Width() const { return impl_->width_; }
int32_t Image::Height() const { return impl_->height_; }
PixelType Image::Type() const { return impl_->type_; }
ChannelType Image::GetChannelType() const { return impl_->channelType_; }
size_t Image::Stride() const { return impl_->stride_; }
bool Image::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool Image::IsValid() const { return impl_->data_ != nullptr && !Empty(); }

int Image::Channels() const {
    switch (impl_->channelType_) {
        case ChannelType::Gray: return 1;
        case ChannelType::RGB:
        case ChannelType::BGR: return 3;
        case ChannelType::RGBA:
        case ChannelType::BGRA: return 4;
    }
    return 1;
}

// =============================================================================
// Data Access
// =============================================================================

void* Image::Data() { return impl_->data_.get(); }
const void* Image::Data() const { return impl_->data_.get(); }

void* Image::RowPtr(int32_t row) {
    return impl_->data_.get() + row * impl_->stride_;
}

const void* Image::RowPtr(int32_t row) const {
    return impl_->data_.get() + row * impl_->stride_;
}

uint8_t Image::At(int32_t x, int32_t y) const {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("At() only supports UInt8 grayscale");
    }
    return static_cast<const uint8_t*>(RowPtr(y))[x];
}

void Image::SetAt(int32_t x, int32_t y, uint8_t value) {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("SetAt() only supports UInt8 grayscale");
    }
    static_cast<uint8_t*>(RowPtr(y))[x] = value;
}

// =============================================================================
// Image Operations
// =============================================================================

Image Image::Clone() const {
    if (Empty()) {
        return Image();
    }

    Image copy(impl_->width_, impl_->height_,
               impl_->type_, impl_->channelType_);

    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(copy.RowPtr(y), RowPtr(y),
                    impl_->width_ * impl_->BytesPerPixel());
    }

    return copy;
}

bool Image::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // Only support UInt8 for now
    if (impl_->type_ != PixelType::UInt8) {
        return false;
    }

    int channels = Channels();

    // Create contiguous buffer
    std::vector<uint8_t> buffer(impl_->width_ * impl_->height_ * channels);
    size_t srcStride = impl_->width_ * channels;

    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(buffer.data() + y * srcStride, RowPtr(y), srcStride);
    }

    // Determine format from extension
    if (path.size() >= 4) {
        std::string ext = path.substr(path.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".png") {
            return stbi_write_png(path.c_str(), impl_->width_, impl_->height_,
                                  channels, buffer.data(), static_cast<int>(srcStride)) != 0;
        } else if (ext == ".jpg" || ext == "jpeg") {
            return stbi_write_jpg(path.c_str(), impl_->width_, impl_->height_,
                                  channels, buffer.data(), 95) != 0;
        } else if (ext == ".bmp") {
            return stbi_write_bmp(path.c_str(), impl_->width_, impl_->height_,
                                  channels, buffer.data()) != 0;
        }
    }

    // Default to PNG
    return stbi_write_png(path.c_str(), impl_->width_, impl_->height_,
                          channels, buffer.data(), static_cast<int>(srcStride)) != 0;
}

} // namespace Vis::Match
