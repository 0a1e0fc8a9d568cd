#pragma once

#include <string>
#include <utility>

namespace mbt::auth {

// External authorization collaborator. The transfer core only passes the
// token and client id through; it never issues or parses them.
class Authorizer {
public:
  virtual ~Authorizer() = default;
  virtual bool authorize(const std::string& token, const std::string& client_id) = 0;
};

// Accepts requests carrying the configured token; any token when none is configured.
class StaticTokenAuthorizer : public Authorizer {
public:
  explicit StaticTokenAuthorizer(std::string expected_token) : expected_(std::move(expected_token)) {}
  bool authorize(const std::string& token, const std::string& client_id) override;

private:
  std::string expected_;
};

} // namespace mbt::auth
