#include <cstdio>
#include <memory>

#include "common/config.hpp"
#include "common/io.hpp"

namespace docpress {
namespace {

struct File_Closer {
    void operator()(std::FILE* file) const noexcept
    {
        std::fclose(file);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

} // namespace

Result<std::string, IO_Error_Code> file_to_string(const std::filesystem::path& path)
{
    constexpr Size block_size = 4096;
    char buffer[block_size];

    const Unique_File stream { std::fopen(path.c_str(), "rb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::string out;
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        out.append(buffer, read_size);
    } while (read_size == block_size);

    return out;
}

bool is_existing_regular_file(const std::filesystem::path& path) noexcept
{
    std::error_code error;
    return std::filesystem::is_regular_file(path, error);
}

} // namespace docpress
