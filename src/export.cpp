#include "export.hpp"
#include "palette.hpp"

#include <png.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/encode_cxx.h>
#include <jxl/color_encoding.h>
#endif

void to_rgba_row(const PixelBuffer& buf, int y, uint32_t* out)
{
    const HsbaPixel* row = buf.pixels.data() + static_cast<size_t>(y) * buf.width;
    for (int x = 0; x < buf.width; ++x)
        out[x] = hsb_to_rgba(row[x].hue, row[x].saturation,
                             row[x].brightness, row[x].alpha);
}

static std::string check_exportable(const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Nothing to export: empty pixel buffer";
    if (buf.size() != static_cast<size_t>(buf.width) * buf.height)
        return "Pixel buffer size does not match its dimensions";
    return {};
}

// ---------------------------------------------------------------------------
// PNG export
//
// Rows are converted one at a time into a single scratch row. On a
// little-endian machine 0xAABBGGRR lies in memory as [R, G, B, A], which is
// what PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
namespace {

// Owns the file and libpng state of one PNG write.
struct PngFile {
    FILE*       fp   = nullptr;
    png_structp png  = nullptr;
    png_infop   info = nullptr;

    ~PngFile()
    {
        if (png) png_destroy_write_struct(&png, info ? &info : nullptr);
        if (fp)  std::fclose(fp);
    }
};

// libpng error callback: keep the message, then unwind to setjmp.
void png_error_message(png_structp png, png_const_charp msg)
{
    auto* err = static_cast<std::string*>(png_get_error_ptr(png));
    *err = std::string("PNG write error: ") + msg;
    png_longjmp(png, 1);
}

}  // namespace

std::string export_png(const char* path, const PixelBuffer& buf)
{
    std::string err = check_exportable(buf);
    if (!err.empty())
        return err;

    PngFile out;
    std::vector<uint32_t> row(static_cast<size_t>(buf.width));

    out.fp = std::fopen(path, "wb");
    if (!out.fp)
        return std::string("Cannot open file for writing: ") + path;

    out.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &err,
                                      png_error_message, nullptr);
    if (!out.png)
        return "png_create_write_struct failed";
    out.info = png_create_info_struct(out.png);
    if (!out.info)
        return "png_create_info_struct failed";

    if (setjmp(png_jmpbuf(out.png)))
        return err;

    png_init_io(out.png, out.fp);
    png_set_IHDR(out.png, out.info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(out.png, out.info);

    for (int y = 0; y < buf.height; ++y) {
        to_rgba_row(buf, y, row.data());
        png_write_row(out.png, reinterpret_cast<png_const_bytep>(row.data()));
    }
    png_write_end(out.png, nullptr);

    FILE* fp = out.fp;
    out.fp = nullptr;
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless 8-bit RGBA). The encoder needs the whole frame up
// front; compressed output is streamed to the file chunk by chunk.
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    std::string err = check_exportable(buf);
    if (!err.empty())
        return err;

    std::vector<uint32_t> frame(buf.size());
    for (int y = 0; y < buf.height; ++y)
        to_rgba_row(buf, y, frame.data() + static_cast<size_t>(y) * buf.width);

    JxlEncoderPtr enc = JxlEncoderMake(nullptr);
    if (!enc) return "JxlEncoderMake failed";

    JxlBasicInfo info;
    JxlEncoderInitBasicInfo(&info);
    info.xsize                 = static_cast<uint32_t>(buf.width);
    info.ysize                 = static_cast<uint32_t>(buf.height);
    info.bits_per_sample       = 8;
    info.alpha_bits            = 8;
    info.num_color_channels    = 3;
    info.num_extra_channels    = 1;
    info.uses_original_profile = JXL_TRUE;

    JxlExtraChannelInfo alpha;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &alpha);
    alpha.bits_per_sample = 8;

    JxlColorEncoding srgb;
    JxlColorEncodingSetToSRGB(&srgb, JXL_FALSE);

    if (JxlEncoderSetBasicInfo(enc.get(), &info) != JXL_ENC_SUCCESS)
        return "JPEG XL: rejected image header";
    if (JxlEncoderSetExtraChannelInfo(enc.get(), 0, &alpha) != JXL_ENC_SUCCESS)
        return "JPEG XL: rejected alpha channel";
    if (JxlEncoderSetColorEncoding(enc.get(), &srgb) != JXL_ENC_SUCCESS)
        return "JPEG XL: rejected sRGB color encoding";

    JxlEncoderFrameSettings* settings = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    if (JxlEncoderSetFrameLossless(settings, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JPEG XL: lossless mode unavailable";

    const JxlPixelFormat fmt = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(settings, &fmt, frame.data(),
                                frame.size() * sizeof(uint32_t)) != JXL_ENC_SUCCESS)
        return "JPEG XL: failed to add frame";
    JxlEncoderCloseInput(enc.get());

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;

    std::vector<uint8_t> chunk(1 << 16);
    JxlEncoderStatus status = JXL_ENC_NEED_MORE_OUTPUT;
    bool write_ok = true;
    while (status == JXL_ENC_NEED_MORE_OUTPUT && write_ok) {
        uint8_t* next  = chunk.data();
        size_t   avail = chunk.size();
        status = JxlEncoderProcessOutput(enc.get(), &next, &avail);
        const size_t n = static_cast<size_t>(next - chunk.data());
        write_ok = std::fwrite(chunk.data(), 1, n, fp) == n;
    }
    const bool closed = std::fclose(fp) == 0;

    if (status != JXL_ENC_SUCCESS)
        return "JPEG XL: encoding failed";
    if (!write_ok || !closed)
        return std::string("Short write to ") + path;
    return {};
}
#endif  // HAVE_JXL

static std::string lower_extension(const std::string& path)
{
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) return {};
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string export_image(const std::string& path, const PixelBuffer& buf)
{
    const std::string ext = lower_extension(path);
    if (ext == "png")
        return export_png(path.c_str(), buf);
    if (ext == "jxl") {
#ifdef HAVE_JXL
        return export_jxl(path.c_str(), buf);
#else
        return "JPEG XL support not compiled in";
#endif
    }
    return "Unsupported output format: " + path + " (expected .png or .jxl)";
}
