#include "RecordDecoder.hpp"
#include <string>
#include "StreamErrors.hpp"

RecordDecoder::RecordDecoder() {
    Json::CharReaderBuilder builder;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;
    reader_.reset(builder.newCharReader());
}

Json::Value RecordDecoder::decode(std::string_view line) const {
    Json::Value value;
    std::string errs;
    bool parsed = false;
    try {
        parsed = reader_->parse(line.data(), line.data() + line.size(), &value, &errs);
    } catch (const Json::Exception& e) {
        // Nesting beyond the reader's stack limit throws instead of returning false
        throw DecodeError(std::string("Malformed JSON record: ") + e.what());
    }
    if (!parsed) {
        // jsoncpp error text ends with a newline
        while (!errs.empty() && (errs.back() == '\n' || errs.back() == '\r')) errs.pop_back();
        throw DecodeError("Malformed JSON record: " + errs);
    }
    return value;
}
