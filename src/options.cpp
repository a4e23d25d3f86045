#include "options.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace {

std::string parse_int(const std::string& flag, const std::string& s, int& out)
{
    if (s.empty()) return "Missing value for " + flag;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX)
        return "Invalid integer for " + flag + ": " + s;
    out = static_cast<int>(v);
    return {};
}

std::string parse_double(const std::string& flag, const std::string& s, double& out)
{
    if (s.empty()) return "Missing value for " + flag;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (*end != '\0' || errno == ERANGE || !std::isfinite(v))
        return "Invalid number for " + flag + ": " + s;
    out = v;
    return {};
}

std::string parse_u64(const std::string& flag, const std::string& s, uint64_t& out)
{
    // strtoull silently negates a leading '-'.
    if (s.empty() || s[0] < '0' || s[0] > '9')
        return "Invalid unsigned integer for " + flag + ": " + s;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE)
        return "Invalid unsigned integer for " + flag + ": " + s;
    out = static_cast<uint64_t>(v);
    return {};
}

} // namespace

std::string parse_options(int argc, char** argv, Options& out)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool        has_inline = false;

        if (arg.rfind("--", 0) == 0) {
            const size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                value      = arg.substr(eq + 1);
                arg        = arg.substr(0, eq);
                has_inline = true;
            }
        }

        if (arg == "--help") { out.help = true; continue; }
        if (arg == "--live") { out.live = true; continue; }

        const bool known = arg == "--seed" || arg == "--scale" || arg == "--width" || arg == "-w"
                        || arg == "--height" || arg == "-h" || arg == "--times" || arg == "--name"
                        || arg == "--metadata" || arg == "--fps";
        if (!known)
            return "Unknown option: " + std::string(argv[i]);

        if (!has_inline) {
            if (i + 1 >= argc) return "Missing value for " + arg;
            value = argv[++i];
        }

        std::string err;
        if (arg == "--seed") {
            uint64_t seed = 0;
            err = parse_u64(arg, value, seed);
            if (err.empty()) out.seed = seed;
        } else if (arg == "--scale") {
            err = parse_double(arg, value, out.scale);
        } else if (arg == "--width" || arg == "-w") {
            err = parse_int(arg, value, out.width);
        } else if (arg == "--height" || arg == "-h") {
            err = parse_int(arg, value, out.height);
        } else if (arg == "--times") {
            err = parse_int(arg, value, out.times);
        } else if (arg == "--name") {
            out.name = value;
        } else if (arg == "--metadata") {
            out.metadata = value;
        } else if (arg == "--fps") {
            err = parse_int(arg, value, out.fps);
        }
        if (!err.empty()) return err;
    }
    return validate_options(out);
}

std::string validate_options(const Options& o)
{
    if (!(o.scale > 0.0) || !std::isfinite(o.scale)) return "--scale must be a positive number";
    if (o.width  < 1) return "--width must be at least 1";
    if (o.height < 1) return "--height must be at least 1";
    if (o.times  < 1) return "--times must be at least 1";
    if (o.fps    < 1) return "--fps must be at least 1";
    if (o.name.empty()) return "--name must not be empty";
    if (o.name.find('/') != std::string::npos || o.name.find('\\') != std::string::npos
        || o.name == "." || o.name == "..")
        return "--name must not contain path separators: " + o.name;
    if (o.metadata && (o.metadata->find('/') != std::string::npos
                       || o.metadata->find('\\') != std::string::npos))
        return "--metadata must not contain path separators";
    // Checked in double so the product cannot overflow int before the test.
    if (o.width * o.scale > 32767.0 || o.height * o.scale > 32767.0)
        return "Image too large: at most 32767 pixels per side";
    if (device_width(o) < 1 || device_height(o) < 1)
        return "--scale makes the image smaller than one pixel";
    return {};
}

void print_usage(FILE* f, const char* prog)
{
    std::fprintf(f,
        "Usage: %s [options]\n"
        "\n"
        "  --seed <u64>          random seed (default: current time in ms)\n"
        "  --scale <f64>         user space to pixel scale (default 1)\n"
        "  --width, -w <int>     width in user-space units (default 100)\n"
        "  --height, -h <int>    height in user-space units (default 100)\n"
        "  --times <int>         number of renders (default 1)\n"
        "  --name <string>       sketch name, images/<name>/ (default sketch)\n"
        "  --metadata <string>   suffix for the image file name\n"
        "  --fps <int>           frames per second for video (default 30)\n"
        "  --live                show the render in a window\n"
        "  --help                show this message\n",
        prog);
}
