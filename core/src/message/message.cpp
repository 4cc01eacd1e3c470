// core/src/message/message.cpp
#include <convco/message/Message.hpp>


namespace convco {

    std::string Message::to_string() const {
        std::string out;
        out.reserve(type.size() + description.size() + (body ? body->size() : 0) + 8);

        out += type;
        if (scope) {
            out += '(';
            out += *scope;
            out += ')';
        }
        if (exclamation) out += '!';
        out += ": ";
        out += description;

        if (body) {
            out += "\n\n";
            out += *body;
        }
        return out;
    }

    Message MessageBuilder::export_message() const {
        Message m{};
        m.type = type_;
        m.scope = scope_;
        m.exclamation = exclamation_;
        m.description = description_;
        m.body = body_;
        return m;
    }

} // namespace convco
