/**
 * @file protocol.cpp
 * @brief Реализация кодека Grin stratum
 */

#include "protocol.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"

#include <charconv>
#include <format>

namespace strata::stratum {

namespace {

/**
 * @brief Идентификатор ответа: число или строка с числом
 */
std::optional<uint64_t> parse_id(const JsonValue& id) {
    if (auto value = id.as_uint64()) {
        return value;
    }
    if (auto text = id.as_string()) {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
        if (ec == std::errc{} && ptr == text->data() + text->size()) {
            return value;
        }
    }
    return std::nullopt;
}

Result<Response> parse_response(const JsonValue& message) {
    const JsonValue* id = message.find("id");
    auto numeric_id = id ? parse_id(*id) : std::nullopt;
    if (!numeric_id) {
        return Err<Response>(ErrorCode::ProtocolMalformed, "Ответ без числового id");
    }

    Response response;
    response.id = *numeric_id;
    if (const JsonValue* result = message.find("result")) {
        response.result = *result;
    }

    if (const JsonValue* error = message.find("error"); error && !error->is_null()) {
        RpcError rpc_error;
        if (auto code = error->find("code")) {
            rpc_error.code = code->as_int64().value_or(0);
        }
        if (auto text = error->find("message"); text && text->as_string()) {
            rpc_error.message = *text->as_string();
        } else if (auto plain = error->as_string()) {
            rpc_error.message = *plain;
        }
        response.error = std::move(rpc_error);
    }

    return response;
}

} // namespace

// =============================================================================
// Кодирование
// =============================================================================

std::string encode_request(uint64_t id, std::string_view method, const JsonValue& params) {
    JsonValue::Object object;
    object["id"] = id;
    object["jsonrpc"] = "2.0";
    object["method"] = method;
    object["params"] = params;
    return to_json(JsonValue(std::move(object)));
}

std::string encode_login(uint64_t id, std::string_view login,
                         std::string_view password, std::string_view agent) {
    JsonValue::Object params;
    params["login"] = login;
    params["pass"] = password;
    params["agent"] = agent;
    return encode_request(id, method::LOGIN, JsonValue(std::move(params)));
}

std::string encode_get_job_template(uint64_t id) {
    return encode_request(id, method::GET_JOB_TEMPLATE, JsonValue());
}

std::string encode_keepalive(uint64_t id) {
    return encode_request(id, method::KEEPALIVE, JsonValue());
}

std::string encode_submit(uint64_t id, const mining::Solution& solution) {
    JsonValue::Array pow;
    pow.reserve(solution.proof.size());
    for (uint64_t edge : solution.proof) {
        pow.emplace_back(edge);
    }

    JsonValue::Object params;
    params["edge_bits"] = solution.edge_bits;
    params["height"] = solution.height;
    params["job_id"] = solution.job_id;
    params["nonce"] = solution.nonce;
    params["pow"] = std::move(pow);
    return encode_request(id, method::SUBMIT, JsonValue(std::move(params)));
}

// =============================================================================
// Разбор
// =============================================================================

Result<mining::Job> parse_job(const JsonValue& value) {
    if (!value.is_object()) {
        return Err<mining::Job>(ErrorCode::ProtocolMalformed, "Задание должно быть объектом");
    }

    mining::Job job;
    job.received_at = std::chrono::steady_clock::now();

    const JsonValue* job_id = value.find("job_id");
    if (job_id && job_id->as_string()) {
        job.job_id = *job_id->as_string();
    } else if (job_id && job_id->as_uint64()) {
        job.job_id = std::format("{}", *job_id->as_uint64());
    }
    if (job.job_id.empty()) {
        return Err<mining::Job>(ErrorCode::ProtocolMalformed, "Задание без job_id");
    }

    const JsonValue* height = value.find("height");
    if (!height || !height->as_uint64()) {
        return Err<mining::Job>(ErrorCode::ProtocolMalformed,
            std::format("Задание {} без height", job.job_id));
    }
    job.height = *height->as_uint64();

    const JsonValue* pre_pow = value.find("pre_pow");
    if (!pre_pow || !pre_pow->as_string()) {
        return Err<mining::Job>(ErrorCode::ProtocolMalformed,
            std::format("Задание {} без pre_pow", job.job_id));
    }
    auto header = from_hex(*pre_pow->as_string());
    if (!header) {
        return std::unexpected(header.error());
    }
    job.pre_pow = std::move(*header);

    if (const JsonValue* difficulty = value.find("difficulty")) {
        auto target = difficulty->as_uint64();
        if (!target) {
            return Err<mining::Job>(ErrorCode::ProtocolMalformed,
                std::format("Задание {}: некорректная difficulty", job.job_id));
        }
        job.difficulty = *target;
    }

    return job;
}

Result<ServerMessage> parse_line(std::string_view line) {
    if (line.size() > constants::MAX_LINE_LENGTH) {
        return Err<ServerMessage>(ErrorCode::ProtocolMalformed,
            std::format("Строка длиннее {} байт", constants::MAX_LINE_LENGTH));
    }

    auto parsed = parse_json(line);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    const JsonValue& message = *parsed;
    if (!message.is_object()) {
        return Err<ServerMessage>(ErrorCode::ProtocolMalformed, "Сообщение должно быть объектом");
    }

    // Сервер повторяет method в ответах, поэтому ответ определяется по result/error
    if (message.find("result") || message.find("error")) {
        auto response = parse_response(message);
        if (!response) {
            return std::unexpected(response.error());
        }
        return ServerMessage(std::move(*response));
    }

    const JsonValue* method_name = message.find("method");
    if (!method_name || !method_name->as_string()) {
        return Err<ServerMessage>(ErrorCode::ProtocolMalformed,
            "Сообщение без result, error и method");
    }

    if (*method_name->as_string() != method::JOB) {
        return Err<ServerMessage>(ErrorCode::ProtocolUnexpected,
            std::format("Неизвестный метод уведомления '{}'", *method_name->as_string()));
    }

    const JsonValue* params = message.find("params");
    if (!params) {
        return Err<ServerMessage>(ErrorCode::ProtocolMalformed, "Уведомление job без params");
    }

    auto job = parse_job(*params);
    if (!job) {
        return std::unexpected(job.error());
    }
    return ServerMessage(JobNotification{std::move(*job)});
}

} // namespace strata::stratum
