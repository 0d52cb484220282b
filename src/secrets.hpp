#pragma once

#include <string>
#include <libsecret/secret.h>

// Desktop keyring entry holding the remote session store's API token, one per endpoint.
class TokenStore {
  public:
    TokenStore();

    bool SaveToken(const std::string &baseUrl, const std::string &token);
    std::string LoadToken(const std::string &baseUrl);
    bool ClearToken(const std::string &baseUrl);

    // "HTTPS://Sessions.example.org/" and "https://sessions.example.org" share one entry.
    // Empty when the URL has no http(s) scheme or no host.
    static std::string EndpointKey(const std::string &baseUrl);

  private:
    SecretSchema m_Schema;
};
