// core/src/os/file.cpp
#include <convco/os/File.hpp>

#include <cstdio>
#include <iterator>

#if !defined(_WIN32)
    #include <cerrno>   // errno
    #include <cstring>  // std::strerror
#endif

namespace convco {

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
        #if defined(_WIN32)
            out_error = "CANNOT open file.";
        #else
            // POSIX: errno 기반 메시지
            out_error = std::string("CANNOT open file: ") + std::strerror(errno);
        #endif
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "파일 크기를 읽을 수 없습니다.";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "파일 읽기 중 일부만 읽혔습니다.";
            return false;
        }

        return true;
    }

    bool read_stream(std::istream& is, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());

        if (is.bad()) {
            out_error = "스트림 읽기에 실패했습니다.";
            return false;
        }
        return true;
    }

} // namespace convco
