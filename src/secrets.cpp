#include "secrets.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
TokenStore::TokenStore()
    : m_Schema{"io.flowlock.GatewayToken",
               SECRET_SCHEMA_NONE,
               {{"endpoint", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, static_cast<SecretSchemaAttributeType>(0)}}} {}

// ─────────────────────────────────────
std::string TokenStore::EndpointKey(const std::string &baseUrl) {
    const auto sep = baseUrl.find("://");
    if (sep == std::string::npos) {
        return "";
    }
    std::string scheme = baseUrl.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        return "";
    }

    std::string rest = baseUrl.substr(sep + 3);
    const auto slash = rest.find('/');
    std::string host = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);
    if (host.empty()) {
        return "";
    }
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return scheme + "://" + host + path;
}

// ─────────────────────────────────────
bool TokenStore::SaveToken(const std::string &baseUrl, const std::string &token) {
    const std::string endpoint = EndpointKey(baseUrl);
    if (endpoint.empty()) {
        spdlog::error("'{}' is not an http(s) session store URL", baseUrl);
        return false;
    }
    if (token.empty()) {
        spdlog::error("Refusing to store an empty gateway token");
        return false;
    }

    GError *error = nullptr;
    const std::string label = "Flowlock session store token for " + endpoint;
    gboolean ok = secret_password_store_sync(&m_Schema, SECRET_COLLECTION_DEFAULT, label.c_str(),
                                             token.c_str(), nullptr, &error, "endpoint",
                                             endpoint.c_str(), nullptr);
    if (error) {
        spdlog::error("failed to store gateway token: {}", error->message);
        g_clear_error(&error);
        return false;
    }

    spdlog::info("Gateway token saved to keyring for {}", endpoint);
    return ok;
}

// ─────────────────────────────────────
std::string TokenStore::LoadToken(const std::string &baseUrl) {
    const std::string endpoint = EndpointKey(baseUrl);
    if (endpoint.empty()) {
        return "";
    }

    GError *error = nullptr;
    gchar *secret = secret_password_lookup_sync(&m_Schema, nullptr, &error, "endpoint",
                                                endpoint.c_str(), nullptr);
    if (error) {
        spdlog::warn("failed to look up gateway token: {}", error->message);
        g_clear_error(&error);
        return "";
    }
    if (!secret) {
        spdlog::debug("No gateway token in keyring for {}", endpoint);
        return "";
    }

    std::string value(secret);
    secret_password_free(secret);
    return value;
}

// ─────────────────────────────────────
bool TokenStore::ClearToken(const std::string &baseUrl) {
    const std::string endpoint = EndpointKey(baseUrl);
    if (endpoint.empty()) {
        spdlog::error("'{}' is not an http(s) session store URL", baseUrl);
        return false;
    }

    GError *error = nullptr;
    gboolean removed = secret_password_clear_sync(&m_Schema, nullptr, &error, "endpoint",
                                                  endpoint.c_str(), nullptr);
    if (error) {
        spdlog::error("failed to clear gateway token: {}", error->message);
        g_clear_error(&error);
        return false;
    }
    if (!removed) {
        spdlog::info("No gateway token stored for {}", endpoint);
    }
    return removed;
}
