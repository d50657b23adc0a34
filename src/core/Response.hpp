#pragma once
#include <string>
#include <string_view>
#include "../interfaces/IHttpTransport.hpp"

namespace ReadServe {

// Buffered response with write-once semantics: status and headers are frozen by the first
// body write, later changes are ignored.
class Response {
public:
    bool SetHeader(const std::string& name, const std::string& value);
    std::string Header(const std::string& name) const;
    const HeaderList& Headers() const { return headers_; }

    bool SetStatus(int status);
    int Status() const { return status_; }

    void Write(std::string_view data);
    const std::string& Body() const { return body_; }
    bool Committed() const { return committed_; }

    // {"error": message} with the given status. Only possible before the first write.
    bool WriteError(int status, const std::string& message);

private:
    int status_ = 200;
    HeaderList headers_;
    std::string body_;
    bool committed_ = false;
};

}
