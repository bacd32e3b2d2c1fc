#include "sse_parser.h"
#include "bridge.h"

bool SSEParser::process_chunk(const std::string& chunk, const EventCallback& callback) {
    if (chunk.empty()) {
        return true;
    }

    buffer_ += chunk;

    size_t pos = 0;
    size_t newline_pos;
    bool keep_going = true;

    while ((newline_pos = buffer_.find('\n', pos)) != std::string::npos) {
        // Handle both \n and \r\n
        size_t line_end = newline_pos;
        if (line_end > pos && buffer_[line_end - 1] == '\r') {
            line_end--;
        }

        std::string line = buffer_.substr(pos, line_end - pos);
        pos = newline_pos + 1;

        if (!process_line(line, callback)) {
            keep_going = false;
            break;
        }
    }

    buffer_.erase(0, pos);
    return keep_going;
}

bool SSEParser::flush(const EventCallback& callback) {
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!process_line(line, callback)) {
            return false;
        }
    }
    if (!data_lines_.empty() || !event_type_.empty()) {
        return dispatch_event(callback);
    }
    return true;
}

bool SSEParser::process_line(const std::string& line, const EventCallback& callback) {
    // Empty line dispatches the event
    if (line.empty()) {
        if (!data_lines_.empty() || !event_type_.empty()) {
            return dispatch_event(callback);
        }
        return true;
    }

    // Comment lines start with :
    if (line[0] == ':') {
        dout(3) << "SSE comment: " << line << std::endl;
        return true;
    }

    size_t colon_pos = line.find(':');
    std::string field;
    std::string value;

    if (colon_pos != std::string::npos) {
        field = line.substr(0, colon_pos);
        value = line.substr(colon_pos + 1);

        // Remove leading space from value
        if (!value.empty() && value[0] == ' ') {
            value = value.substr(1);
        }
    } else {
        // Line with no colon is a field with empty value
        field = line;
    }

    if (field == "event") {
        event_type_ = value;
    } else if (field == "data") {
        data_lines_.push_back(value);
    } else if (field == "id") {
        event_id_ = value;
    } else if (field == "retry") {
        dout(3) << "SSE retry field ignored: " << value << std::endl;
    } else {
        dout(2) << "Unknown SSE field: " << field << std::endl;
    }

    return true;
}

bool SSEParser::dispatch_event(const EventCallback& callback) {
    bool has_data = !data_lines_.empty();
    std::string data;
    for (size_t i = 0; i < data_lines_.size(); ++i) {
        if (i > 0) {
            data += "\n";
        }
        data += data_lines_[i];
    }

    std::string event_type = std::move(event_type_);
    std::string event_id = std::move(event_id_);
    event_type_.clear();
    event_id_.clear();
    data_lines_.clear();

    if (!has_data && event_type.empty()) {
        return true;
    }

    dout(4) << "SSE event - type: '" << event_type << "', data length: " << data.length()
            << ", id: '" << event_id << "'" << std::endl;
    return callback(event_type, data, event_id);
}

void SSEParser::reset() {
    buffer_.clear();
    event_type_.clear();
    event_id_.clear();
    data_lines_.clear();
}
