#include <timber_mcp/backend/bedrock.hpp>

#include <timber_mcp/core/url.hpp>

#include <nlohmann/json.hpp>

namespace timber_mcp {

namespace {

Error MakeParseError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Backend};
}

// Sign and send a JSON POST; non-2xx statuses become errors.
Result<HttpResponse, Error> SignedPost(IHttpTransport& transport,
                                       const SigV4Signer& signer,
                                       const std::string& operation,
                                       const std::string& host,
                                       const std::string& path,
                                       std::string body) {
    SignableRequest signable;
    signable.host = host;
    signable.path = path;
    signable.headers["Content-Type"] = "application/json";
    signable.headers["Accept"] = "application/json";
    signable.body = std::move(body);

    HttpRequest request{host, path, signable.body, signable.headers};
    for (auto& [name, value] : signer.Sign(signable)) {
        request.headers[name] = value;
    }

    auto response = transport.Post(request);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = operation;
        return Result<HttpResponse, Error>::Err(std::move(error));
    }
    if (response.Value().status_code < 200 || response.Value().status_code >= 300) {
        return Result<HttpResponse, Error>::Err(Error::FromHttpStatus(
            operation, host + path, response.Value().status_code,
            response.Value().body));
    }
    return response;
}

} // anonymous namespace

namespace bedrock {

std::string AgentRuntimeHost(std::string_view region) {
    return "bedrock-agent-runtime." + std::string(region) + ".amazonaws.com";
}

std::string RuntimeHost(std::string_view region) {
    return "bedrock-runtime." + std::string(region) + ".amazonaws.com";
}

std::string BuildRetrieveBody(std::string_view query, int max_results) {
    nlohmann::json body = {
        {"retrievalQuery", {{"text", std::string(query)}}},
        {"retrievalConfiguration", {
            {"vectorSearchConfiguration", {{"numberOfResults", max_results}}}
        }}
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<RetrievalResult, Error> ParseRetrieveResponse(std::string_view body) {
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<RetrievalResult, Error>::Err(
            MakeParseError("Retrieve", "Response is not a JSON object"));
    }

    RetrievalResult result;
    auto it = parsed.find("retrievalResults");
    if (it == parsed.end() || it->is_null()) {
        return Result<RetrievalResult, Error>::Ok(std::move(result));
    }
    if (!it->is_array()) {
        return Result<RetrievalResult, Error>::Err(
            MakeParseError("Retrieve", "'retrievalResults' is not an array"));
    }

    for (const auto& item : *it) {
        if (!item.is_object()) continue;
        const auto content = item.find("content");
        if (content == item.end() || !content->is_object()) continue;
        const auto text = content->find("text");
        if (text == content->end() || !text->is_string()) continue;

        Passage passage;
        passage.text = text->get<std::string>();
        if (auto score = item.find("score"); score != item.end() && score->is_number()) {
            passage.score = score->get<double>();
        }
        if (auto location = item.find("location");
            location != item.end() && location->is_object()) {
            auto s3 = location->find("s3Location");
            if (s3 != location->end() && s3->is_object() &&
                s3->contains("uri") && (*s3)["uri"].is_string()) {
                passage.source = (*s3)["uri"].get<std::string>();
            }
        }
        result.passages.push_back(std::move(passage));
    }
    return Result<RetrievalResult, Error>::Ok(std::move(result));
}

std::string BuildInvokeModelBody(std::string_view prompt, int max_output_tokens) {
    nlohmann::json body = {
        {"anthropic_version", "bedrock-2023-05-31"},
        {"max_tokens", max_output_tokens},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", std::string(prompt)}}
        })}
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<std::string, Error> ParseInvokeModelResponse(std::string_view body) {
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<std::string, Error>::Err(
            MakeParseError("InvokeModel", "Response is not a JSON object"));
    }
    auto content = parsed.find("content");
    if (content == parsed.end() || !content->is_array() || content->empty()) {
        return Result<std::string, Error>::Err(
            MakeParseError("InvokeModel", "Response has no content"));
    }
    for (const auto& block : *content) {
        if (block.is_object() && block.value("type", "text") == "text" &&
            block.contains("text") && block["text"].is_string()) {
            return Result<std::string, Error>::Ok(block["text"].get<std::string>());
        }
    }
    return Result<std::string, Error>::Err(
        MakeParseError("InvokeModel", "Response has no text content block"));
}

} // namespace bedrock

// ---------------------------------------------------------------------------
// BedrockRetrievalService
// ---------------------------------------------------------------------------
BedrockRetrievalService::BedrockRetrievalService(IHttpTransport& transport,
                                                 SigV4Signer signer,
                                                 Logger& logger)
    : transport_(transport), signer_(std::move(signer)), logger_(logger) {}

Result<RetrievalResult, Error> BedrockRetrievalService::Retrieve(
    const KnowledgeBaseId& knowledge_base, std::string_view query, int max_results) {
    const auto host = bedrock::AgentRuntimeHost(signer_.Region());
    const auto path = "/knowledgebases/" + UrlEncode(knowledge_base.Value()) + "/retrieve";

    logger_.Debug("backend", "Retrieve from " + knowledge_base.Value() +
                                 " (max " + std::to_string(max_results) + ")");
    auto response = SignedPost(transport_, signer_, "Retrieve", host, path,
                               bedrock::BuildRetrieveBody(query, max_results));
    if (response.IsErr()) {
        return Result<RetrievalResult, Error>::Err(std::move(response).Error());
    }
    return bedrock::ParseRetrieveResponse(response.Value().body);
}

// ---------------------------------------------------------------------------
// BedrockGenerationService
// ---------------------------------------------------------------------------
BedrockGenerationService::BedrockGenerationService(IHttpTransport& transport,
                                                   SigV4Signer signer,
                                                   Logger& logger)
    : transport_(transport), signer_(std::move(signer)), logger_(logger) {}

Result<std::string, Error> BedrockGenerationService::Generate(
    const ModelId& model, std::string_view prompt, int max_output_tokens) {
    const auto host = bedrock::RuntimeHost(signer_.Region());
    const auto path = "/model/" + UrlEncode(model.Value()) + "/invoke";

    logger_.Debug("backend", "InvokeModel " + model.Value() + " (" +
                                 std::to_string(prompt.size()) + " prompt bytes)");
    auto response = SignedPost(transport_, signer_, "InvokeModel", host, path,
                               bedrock::BuildInvokeModelBody(prompt, max_output_tokens));
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(std::move(response).Error());
    }
    return bedrock::ParseInvokeModelResponse(response.Value().body);
}

} // namespace timber_mcp
