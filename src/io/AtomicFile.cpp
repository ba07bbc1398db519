#include "io/AtomicFile.h"

#include <fstream>
#include <system_error>

namespace {

void set_error(std::string* err, const std::string& what, const std::error_code& ec)
{
    if (!err) return;
    *err = what;
    if (ec)
    {
        *err += ": ";
        *err += ec.message();
    }
}

bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err)
{
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        set_error(err, "open failed for " + temp.string(), {});
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out)
    {
        set_error(err, "write failed for " + temp.string(), {});
        return false;
    }
    out.close();
    return static_cast<bool>(out);
}

} // namespace

namespace launchpad::io {

bool write_atomic(const fs::path& final_path, std::string_view bytes, std::string* err)
{
    std::error_code ec;
    if (final_path.has_parent_path())
    {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec)
        {
            set_error(err, "create_directories failed for " + final_path.parent_path().string(), ec);
            return false;
        }
    }

    const fs::path tmp = temp_path_for(final_path);
    if (!write_temp_and_flush(tmp, bytes, err))
    {
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, final_path, ec);
    if (ec)
    {
        set_error(err, "rename failed for " + final_path.string(), ec);
        std::error_code rm;
        fs::remove(tmp, rm);
        return false;
    }
    return true;
}

bool read_all(const fs::path& path, std::string& out, std::string* err)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        set_error(err, "not a regular file: " + path.string(), ec);
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        set_error(err, "open failed for " + path.string(), {});
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto sz = in.tellg();
    if (sz < 0)
    {
        set_error(err, "size query failed for " + path.string(), {});
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize(static_cast<std::size_t>(sz));
    if (sz > 0) in.read(out.data(), sz);
    if (!in)
    {
        set_error(err, "read failed for " + path.string(), {});
        return false;
    }
    return true;
}

} // namespace launchpad::io
