// core/src/log/sink.cpp
#include <convco/log/Sink.hpp>
#include <convco/diag/Render.hpp>


namespace convco::log {

    void StreamSink::info(std::string_view event, std::string_view key, std::string_view value) {
        std::lock_guard<std::mutex> lock(mu_);
        os_ << "info: " << event;
        if (!key.empty()) os_ << " " << key << "=" << value;
        os_ << "\n";
    }

    void StreamSink::error(const diag::Diagnostic& d) {
        const std::string msg = diag::render_message(d, lang_);

        std::lock_guard<std::mutex> lock(mu_);
        os_ << "error[" << diag::code_name(d.code()) << "]: " << msg << "\n";
    }

} // namespace convco::log
