#include <filesystem>
#include <string>

#include "Inkwell.h"

using namespace Inkwell::Core;
using namespace Inkwell::Core::IO;

static std::string makeTempFile(const std::string& base) {
    auto dir = std::filesystem::temp_directory_path();
    auto path = dir / (base + ".md");
    return path.string();
}

static bool report(const WriteResult& r) {
    if (!r.succeeded()) {
        INKWELL_LOG_ERROR(std::string("write failed: ") + r.message);
        return false;
    }
    INKWELL_LOG_INFO(r.message + " [" + toString(r.usedStrategy) + ", " +
                     std::to_string(r.bytesAppended) + " bytes]");
    return true;
}

int main() {
    auto& logger = Logging::Logger::global();
    VirtualFileSystem vfs(logger);
    const std::string path = makeTempFile("inkwell_incremental");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    // An agent writes the first part of a document and gets cut off (no completion marker)
    if (!report(vfs.write(path, "# Notes\n\nFirst paragraph.\nSecond para"))) return 1;

    // It resends from a little before the cut-off; only the new text is appended
    if (!report(vfs.smartAppend(path, "Second paragraph.\nThird paragraph.\n"))) return 1;

    // Resending the same text again changes nothing
    if (!report(vfs.smartAppend(path, "Third paragraph.\n"))) return 1;

    // A complete replacement carries the marker and is written as-is, minus the marker
    if (!report(vfs.write(path, "# Notes\n\nRewritten from scratch.\n// END_OF_CONTENT"))) return 1;

    auto r = vfs.read(path);
    if (!r.succeeded()) {
        INKWELL_LOG_ERROR(std::string("read failed: ") + r.errorInfo().message);
        return 1;
    }
    INKWELL_LOG_INFO(std::string("Final content:\n") + r.contentsText());

    auto st = vfs.stat(path);
    if (st.succeeded() && st.metadata()) {
        INKWELL_LOG_INFO("Size " + std::to_string(st.metadata()->size) + " bytes, mode " + st.metadata()->permissions);
    }

    std::filesystem::remove(path, ec);
    return 0;
}
