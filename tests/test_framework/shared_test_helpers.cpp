#include "shared_test_helpers.h"

#include <fstream>
#include <iterator>
#include <thread>

namespace servefleet::tests::helper
{

namespace fs = std::filesystem;

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t n = 0;
    while (!text.empty())
    {
        const auto eol = text.find('\n');
        const std::string_view line = text.substr(0, eol);
        const bool has = !must_include || line.find(*must_include) != std::string_view::npos;
        const bool lacks = !must_exclude || line.find(*must_exclude) == std::string_view::npos;
        if (has && lacks)
            ++n;
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);
    }
    return n;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string contents;
    do
    {
        if (read_file_contents(path.string(), contents) &&
            contents.find(expected) != std::string::npos)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    } while (std::chrono::steady_clock::now() < deadline);
    return false;
}

void write_text_file(const fs::path &path, const std::string &content)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    ASSERT_FALSE(ec) << "cannot create " << path.parent_path() << ": " << ec.message();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out.is_open()) << "cannot write " << path;
    out << content;
}

TempDir::TempDir(const std::string &tag)
    : m_path(fs::temp_directory_path() /
             fmt::format("sfl-test-{}-{}-{}", tag, servefleet::platform::get_pid(),
                         servefleet::format_tools::random_hex_id()))
{
    fs::create_directories(m_path);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

} // namespace servefleet::tests::helper
