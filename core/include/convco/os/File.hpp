// core/include/convco/os/File.hpp
#pragma once
#include <istream>
#include <string>


namespace convco {

    /// @brief 파일 내용을 바이트 그대로 읽는다 (바이너리 모드)
    /// @details 개행 정규화를 하지 않는다. CR/LF 는 문법의 일부이므로 그대로 보존해야 한다.
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 스트림(예: stdin)의 남은 내용을 바이트 그대로 읽는다.
    bool read_stream(std::istream& is, std::string& out_content, std::string& out_error);

} // namespace convco
