#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"
#include "../protocol.hpp"

namespace hpipe
{
    namespace http
    {

        // Helper: Parse the pipe path from regex matches
        inline bool parse_pipe_path(const httplib::Request &req, std::string &path)
        {
            if (req.matches.size() >= 2)
            {
                path = req.matches[1].str();
                return !path.empty();
            }
            return false;
        }

        // Helper: Resume offset from header, falling back to the query parameter.
        // Absent leaves offset empty; a malformed value is an error.
        inline bool parse_resume_offset(const httplib::Request &req,
                                        std::optional<uint64_t> &offset,
                                        std::string &error)
        {
            std::string text;
            if (req.has_header(kOffsetHeader))
            {
                text = req.get_header_value(kOffsetHeader);
            }
            else if (req.has_param(kOffsetParam))
            {
                text = req.get_param_value(kOffsetParam);
            }
            else
            {
                offset.reset();
                return true;
            }

            uint64_t value = 0;
            if (!parse_offset(text, value))
            {
                error = "Invalid resume offset: '" + text + "'";
                return false;
            }
            offset = value;
            return true;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send error envelope
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

    } // namespace http
} // namespace hpipe
