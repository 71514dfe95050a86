#include "image_optimizer.hpp"
#include "mime.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace quire::engine {

    namespace {

        // Enough for JPEG files carrying large EXIF/ICC segments ahead of SOF.
        constexpr size_t kProbeBytes = 256 * 1024;

        using Bytes = std::string;

        uint32_t be16(const Bytes& b, size_t at) {
            return (static_cast<uint8_t>(b[at]) << 8) | static_cast<uint8_t>(b[at + 1]);
        }

        uint32_t be32(const Bytes& b, size_t at) {
            return (be16(b, at) << 16) | be16(b, at + 2);
        }

        uint32_t le16(const Bytes& b, size_t at) {
            return static_cast<uint8_t>(b[at]) | (static_cast<uint8_t>(b[at + 1]) << 8);
        }

        uint32_t le24(const Bytes& b, size_t at) {
            return le16(b, at) | (static_cast<uint8_t>(b[at + 2]) << 16);
        }

        bool probe_png(const Bytes& b, ImageDimensions& out) {
            if (b.size() < 24 || b.compare(0, 8, "\x89PNG\r\n\x1A\n") != 0 || b.compare(12, 4, "IHDR") != 0) return false;
            out = {be32(b, 16), be32(b, 20)};
            return true;
        }

        bool probe_gif(const Bytes& b, ImageDimensions& out) {
            if (b.size() < 10 || (b.compare(0, 6, "GIF87a") != 0 && b.compare(0, 6, "GIF89a") != 0)) return false;
            out = {le16(b, 6), le16(b, 8)};
            return true;
        }

        bool probe_jpeg(const Bytes& b, ImageDimensions& out) {
            if (b.size() < 4 || static_cast<uint8_t>(b[0]) != 0xFF || static_cast<uint8_t>(b[1]) != 0xD8) return false;

            size_t pos = 2;
            while (pos + 4 <= b.size()) {
                if (static_cast<uint8_t>(b[pos]) != 0xFF) return false;
                while (pos < b.size() && static_cast<uint8_t>(b[pos]) == 0xFF) ++pos;
                if (pos >= b.size()) return false;

                uint8_t marker = static_cast<uint8_t>(b[pos++]);
                if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) continue;
                if (marker == 0xD9 || marker == 0xDA || pos + 2 > b.size()) return false;

                uint32_t length = be16(b, pos);
                bool is_sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
                if (is_sof) {
                    if (pos + 7 > b.size()) return false;
                    out = {be16(b, pos + 5), be16(b, pos + 3)};
                    return true;
                }
                if (length < 2) return false;
                pos += length;
            }
            return false;
        }

        bool probe_webp(const Bytes& b, ImageDimensions& out) {
            if (b.size() < 30 || b.compare(0, 4, "RIFF") != 0 || b.compare(8, 4, "WEBP") != 0) return false;

            if (b.compare(12, 4, "VP8 ") == 0) {
                out = {le16(b, 26) & 0x3FFF, le16(b, 28) & 0x3FFF};
                return true;
            }
            if (b.compare(12, 4, "VP8L") == 0) {
                uint32_t b0 = static_cast<uint8_t>(b[21]), b1 = static_cast<uint8_t>(b[22]);
                uint32_t b2 = static_cast<uint8_t>(b[23]), b3 = static_cast<uint8_t>(b[24]);
                out.width = 1 + (((b1 & 0x3F) << 8) | b0);
                out.height = 1 + (((b3 & 0x0F) << 10) | (b2 << 2) | ((b1 & 0xC0) >> 6));
                return true;
            }
            if (b.compare(12, 4, "VP8X") == 0) {
                out = {1 + le24(b, 24), 1 + le24(b, 27)};
                return true;
            }
            return false;
        }

        bool probe_avif(const Bytes& b, ImageDimensions& out) {
            if (b.size() < 12 || b.compare(4, 4, "ftyp") != 0) return false;
            size_t at = b.find("ispe");
            if (at == Bytes::npos || at + 16 > b.size()) return false;
            out = {be32(b, at + 8), be32(b, at + 12)};
            return true;
        }

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        // Finds the opening <svg ...> tag and returns its attribute text.
        bool find_svg_tag(const Bytes& b, std::string& attrs) {
            size_t at = 0;
            while ((at = b.find('<', at)) != Bytes::npos) {
                if (at + 4 <= b.size() && std::tolower(static_cast<unsigned char>(b[at + 1])) == 's' &&
                    std::tolower(static_cast<unsigned char>(b[at + 2])) == 'v' &&
                    std::tolower(static_cast<unsigned char>(b[at + 3])) == 'g' &&
                    (at + 4 == b.size() || is_space(b[at + 4]) || b[at + 4] == '>' || b[at + 4] == '/')) {
                    size_t close = b.find('>', at + 4);
                    if (close == Bytes::npos) return false;
                    attrs = b.substr(at + 4, close - at - 4);
                    return true;
                }
                ++at;
            }
            return false;
        }

        // Value of a quoted attribute; the name must start the attribute.
        bool attribute_value(const std::string& attrs, const std::string& name, std::string& value) {
            size_t at = 0;
            while ((at = attrs.find(name, at)) != std::string::npos) {
                size_t pos = at + name.size();
                bool starts_attr = at == 0 || is_space(attrs[at - 1]);
                while (pos < attrs.size() && is_space(attrs[pos])) ++pos;
                if (starts_attr && pos < attrs.size() && attrs[pos] == '=') {
                    ++pos;
                    while (pos < attrs.size() && is_space(attrs[pos])) ++pos;
                    if (pos >= attrs.size() || (attrs[pos] != '"' && attrs[pos] != '\'')) return false;
                    size_t close = attrs.find(attrs[pos], pos + 1);
                    if (close == std::string::npos) return false;
                    value = attrs.substr(pos + 1, close - pos - 1);
                    return true;
                }
                at += name.size();
            }
            return false;
        }

        uint32_t clamp_dimension(double v) {
            if (!(v > 0.0)) return 0;
            if (v >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
                return std::numeric_limits<uint32_t>::max();
            }
            return static_cast<uint32_t>(v);
        }

        // Plain number with an optional "px" unit; percentages and other units are rejected.
        bool parse_length(const std::string& text, uint32_t& out) {
            const char* begin = text.c_str();
            while (is_space(*begin)) ++begin;
            if (!std::isdigit(static_cast<unsigned char>(*begin))) return false;
            char* end = nullptr;
            double v = std::strtod(begin, &end);
            if (end == begin) return false;
            if (end[0] == 'p' && end[1] == 'x') end += 2;
            while (is_space(*end)) ++end;
            if (*end != '\0') return false;
            out = clamp_dimension(v);
            return true;
        }

        bool parse_view_box(const std::string& text, ImageDimensions& out) {
            double values[4];
            const char* cursor = text.c_str();
            for (double& v : values) {
                while (is_space(*cursor) || *cursor == ',') ++cursor;
                char* end = nullptr;
                v = std::strtod(cursor, &end);
                if (end == cursor) return false;
                cursor = end;
            }
            out = {clamp_dimension(values[2]), clamp_dimension(values[3])};
            return true;
        }

        bool probe_svg(const Bytes& b, ImageDimensions& out) {
            std::string attrs;
            if (!find_svg_tag(b, attrs)) return false;

            std::string width, height;
            ImageDimensions dims;
            if (attribute_value(attrs, "width", width) && attribute_value(attrs, "height", height) &&
                parse_length(width, dims.width) && parse_length(height, dims.height)) {
                out = dims;
                return true;
            }
            std::string view_box;
            if (attribute_value(attrs, "viewBox", view_box) && parse_view_box(view_box, dims)) {
                out = dims;
                return true;
            }
            return false;
        }

        class ProbeImageOptimizer : public ImageOptimizer {
        public:
            ImageDimensions get_image_dimensions(const std::filesystem::path& path) override {
                return read_image_dimensions(path);
            }

            std::vector<AssetDerivative> generate_responsive_variants(const ProcessedAsset&,
                                                                      const ResponsiveVariantOptions&) override {
                return {};
            }

            std::vector<AssetDerivative> convert_to_modern_formats(const ProcessedAsset&,
                                                                   const ModernFormatOptions&) override {
                return {};
            }
        };

    }

    ImageDimensions read_image_dimensions(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) throw std::runtime_error("cannot open " + path.string());

        Bytes head(kProbeBytes, '\0');
        file.read(&head[0], static_cast<std::streamsize>(head.size()));
        head.resize(static_cast<size_t>(file.gcount()));

        ImageDimensions dims;
        if (probe_png(head, dims) || probe_gif(head, dims) || probe_jpeg(head, dims) ||
            probe_webp(head, dims) || probe_avif(head, dims)) {
            return dims;
        }
        if (lowercase_extension(path) == ".svg" && probe_svg(head, dims)) return dims;

        throw std::runtime_error("unrecognised image header in " + path.string());
    }

    std::string derivative_public_path(const ProcessedAsset& asset, const std::string& hashed_filename) {
        auto slash = asset.public_path.rfind('/');
        std::string dir = (slash == std::string::npos) ? std::string() : asset.public_path.substr(0, slash);
        return dir + "/" + hashed_filename;
    }

    std::unique_ptr<ImageOptimizer> create_probe_optimizer() {
        return std::make_unique<ProbeImageOptimizer>();
    }

}
