#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace imagine {

// A mkstemp() file beside its final destination. Unlinked on destruction unless
// committed.
class TempFile {
public:
    static Result CreateBeside(const std::string& final_path, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;

    // fsync + close + rename over final_path.
    Result CommitTo(const std::string& final_path);

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// Readers of final_path observe either the old content or the new one.
Result WriteFileAtomically(const std::string& final_path, std::string_view content);

} // namespace imagine
