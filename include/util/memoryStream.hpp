#pragma once

#include <istream>
#include <streambuf>
#include <string_view>

namespace mv::util {

// Read-only, seekable stream over memory owned elsewhere
class MemoryStreamBuf : public std::streambuf {
public:
    explicit MemoryStreamBuf(const std::string_view data) {
        auto* begin = const_cast<char*>(data.data());
        setg(begin, begin, begin + data.size());
    }

protected:
    pos_type seekoff(const off_type off, const std::ios_base::seekdir dir, const std::ios_base::openmode which) override {
        if (!(which & std::ios_base::in)) return pos_type(off_type(-1));

        off_type base = 0;
        if (dir == std::ios_base::cur) base = gptr() - eback();
        else if (dir == std::ios_base::end) base = egptr() - eback();

        const off_type target = base + off;
        if (target < 0 || target > egptr() - eback()) return pos_type(off_type(-1));
        setg(eback(), eback() + target, egptr());
        return pos_type(target);
    }

    pos_type seekpos(const pos_type pos, const std::ios_base::openmode which) override {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }
};

class MemoryIStream : public std::istream {
public:
    explicit MemoryIStream(const std::string_view data) : std::istream(nullptr), buf_(data) { rdbuf(&buf_); }

private:
    MemoryStreamBuf buf_;
};

}
