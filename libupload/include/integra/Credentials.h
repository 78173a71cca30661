#ifndef INTEGRA_LIBUPLOAD_INTEGRA_CREDENTIALS_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_CREDENTIALS_H_

#include <istream>
#include <string>

#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

constexpr const char* kDefaultRegion = "us-east-1";

/// The settings of one profile in an AWS shared credentials file
struct AwsProfile {
  std::string access_key;
  std::string secret_key;
  std::string region;
  std::string endpoint_url;
};

/// ClientSettings are everything an object store client needs to connect.
/// Empty keys mean "use the SDK's default credential provider chain"; an
/// empty endpoint_url means the public AWS endpoint for region.
struct ClientSettings {
  std::string access_key;
  std::string secret_key;
  std::string region;
  std::string endpoint_url;

  bool has_static_credentials() const {
    return !access_key.empty() && !secret_key.empty();
  }
};

/// A ResolveRequest holds what the caller asked for. Empty strings are
/// unset.
struct ResolveRequest {
  std::string profile;
  std::string access_key;
  std::string secret_key;
  std::string region;
  std::string endpoint_url;
};

/// ParseCredentials reads an INI-style AWS credentials file and returns the
/// settings of the named profile. Blank lines and lines starting with '#' or
/// ';' are ignored. Unknown keys are ignored.
///
/// \returns CredentialsError if the profile does not exist or does not
///   define both aws_access_key_id and aws_secret_access_key
INTEGRA_EXPORT Result<AwsProfile> ParseCredentials(
    std::istream& in, const std::string& profile);

/// DefaultCredentialsPath is env[AWS_SHARED_CREDENTIALS_FILE] if set,
/// otherwise $HOME/.aws/credentials.
INTEGRA_EXPORT std::string DefaultCredentialsPath();

/// A CredentialResolver turns what the caller asked for into concrete client
/// settings. Resolution happens before any remote call is made.
class INTEGRA_EXPORT CredentialResolver {
public:
  CredentialResolver() = default;
  CredentialResolver(const CredentialResolver& no_copy) = delete;
  CredentialResolver(CredentialResolver&& no_move) = delete;
  CredentialResolver& operator=(const CredentialResolver& no_copy) = delete;
  CredentialResolver& operator=(CredentialResolver&& no_move) = delete;
  virtual ~CredentialResolver();

  virtual Result<ClientSettings> Resolve(const ResolveRequest& request) = 0;
};

/// ProfileCredentialResolver resolves settings from a shared credentials
/// file and the environment:
///
/// - endpoint: env[AWS_ENDPOINT_URL], then the profile's endpoint_url, then
///   the requested endpoint
/// - region: the profile's region, then the requested region, then us-east-1
/// - keys: the requested key pair, then the profile's keys
///
/// The file is only read when a profile is requested.
class INTEGRA_EXPORT ProfileCredentialResolver : public CredentialResolver {
public:
  ProfileCredentialResolver()
      : ProfileCredentialResolver(DefaultCredentialsPath()) {}
  explicit ProfileCredentialResolver(std::string credentials_path)
      : credentials_path_(std::move(credentials_path)) {}

  Result<ClientSettings> Resolve(const ResolveRequest& request) override;

  const std::string& credentials_path() const { return credentials_path_; }

private:
  std::string credentials_path_;
};

}  // namespace integra

#endif
