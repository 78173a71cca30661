#include "integra/Credentials.h"

#include <fstream>

#include "integra/Env.h"
#include "integra/FileSystem.h"
#include "integra/Logging.h"
#include "integra/Strings.h"
#include "integra/UploadErrors.h"

integra::CredentialResolver::~CredentialResolver() = default;

integra::Result<integra::AwsProfile>
integra::ParseCredentials(std::istream& in, const std::string& profile) {
  AwsProfile prof;
  bool found = false;
  std::string current;
  std::string line;

  while (std::getline(in, line)) {
    std::string_view trimmed = TrimSpace(line);
    if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
      continue;
    }

    if (trimmed.front() == '[' && trimmed.back() == ']') {
      current = std::string(TrimSpace(trimmed.substr(1, trimmed.size() - 2)));
      if (current == profile) {
        found = true;
      }
      continue;
    }

    if (current != profile) {
      continue;
    }

    std::vector<std::string_view> kv = SplitView(trimmed, "=", 1);
    if (kv.size() != 2) {
      continue;
    }
    std::string_view key = TrimSpace(kv[0]);
    std::string value(TrimSpace(kv[1]));

    if (key == "aws_access_key_id") {
      prof.access_key = value;
    } else if (key == "aws_secret_access_key") {
      prof.secret_key = value;
    } else if (key == "region") {
      prof.region = value;
    } else if (key == "endpoint_url") {
      prof.endpoint_url = value;
    }
  }

  if (in.bad()) {
    return INTEGRA_ERROR(
        UploadErrorCode::CredentialsError, "reading credentials file");
  }
  if (!found) {
    return INTEGRA_ERROR(
        UploadErrorCode::CredentialsError, "profile '{}' not found", profile);
  }
  if (prof.access_key.empty() || prof.secret_key.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::CredentialsError,
        "access key or secret key not found in profile '{}'", profile);
  }
  return prof;
}

std::string
integra::DefaultCredentialsPath() {
  if (auto path = GetEnv("AWS_SHARED_CREDENTIALS_FILE"); path) {
    return *path;
  }
  std::string home = GetEnv("HOME").value_or("");
  return JoinPath(JoinPath(home, ".aws"), "credentials");
}

integra::Result<integra::ClientSettings>
integra::ProfileCredentialResolver::Resolve(const ResolveRequest& request) {
  if (request.access_key.empty() != request.secret_key.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::CredentialsError,
        "access key and secret key must be given together");
  }

  ClientSettings settings;
  settings.access_key = request.access_key;
  settings.secret_key = request.secret_key;
  settings.region = request.region;
  settings.endpoint_url = request.endpoint_url;

  if (!request.profile.empty()) {
    std::ifstream in(credentials_path_);
    if (!in) {
      return INTEGRA_ERROR(
          UploadErrorCode::CredentialsError,
          "unable to open credentials file {}", credentials_path_);
    }
    AwsProfile prof = INTEGRA_CHECKED_CONTEXT(
        ParseCredentials(in, request.profile), "reading {}",
        credentials_path_);

    if (!prof.region.empty()) {
      settings.region = prof.region;
    }
    if (!prof.endpoint_url.empty()) {
      settings.endpoint_url = prof.endpoint_url;
    }
    if (!settings.has_static_credentials()) {
      settings.access_key = prof.access_key;
      settings.secret_key = prof.secret_key;
    }
  }

  if (auto env_endpoint = GetEnv("AWS_ENDPOINT_URL"); env_endpoint) {
    INTEGRA_LOG_VERBOSE(
        "AWS_ENDPOINT_URL overrides endpoint {}", settings.endpoint_url);
    settings.endpoint_url = *env_endpoint;
  }

  if (settings.region.empty()) {
    settings.region = kDefaultRegion;
  }

  return settings;
}
