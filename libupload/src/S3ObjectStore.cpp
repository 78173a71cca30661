#include "integra/S3ObjectStore.h"

#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/auth/STSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include "integra/Env.h"
#include "integra/Logging.h"
#include "integra/Strings.h"
#include "integra/UploadErrors.h"

namespace {

constexpr const char* kAwsTag = "IntegraS3Client";

/// IntegraCredentialsChain is the default AWS provider chain: environment,
/// shared profile files, credential processes, web identity and then
/// container or instance roles.
class IntegraCredentialsChain : public Aws::Auth::AWSCredentialsProviderChain {
public:
  IntegraCredentialsChain() : AWSCredentialsProviderChain() {
    AddProvider(
        Aws::MakeShared<Aws::Auth::EnvironmentAWSCredentialsProvider>(kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::ProfileConfigFileAWSCredentialsProvider>(
            kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::ProcessCredentialsProvider>(kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::STSAssumeRoleWebIdentityCredentialsProvider>(
            kAwsTag));

    std::optional<std::string> relative_uri =
        integra::GetEnv("AWS_CONTAINER_CREDENTIALS_RELATIVE_URI");
    std::optional<std::string> absolute_uri =
        integra::GetEnv("AWS_CONTAINER_CREDENTIALS_FULL_URI");
    bool ec2_metadata_disabled =
        integra::GetEnvFlag("AWS_EC2_METADATA_DISABLED").value_or(false);

    if (relative_uri) {
      AddProvider(Aws::MakeShared<Aws::Auth::TaskRoleCredentialsProvider>(
          kAwsTag, relative_uri->c_str()));
    } else if (absolute_uri) {
      std::string token =
          integra::GetEnv("AWS_CONTAINER_AUTHORIZATION_TOKEN").value_or("");
      AddProvider(Aws::MakeShared<Aws::Auth::TaskRoleCredentialsProvider>(
          kAwsTag, absolute_uri->c_str(), token.c_str()));
    } else if (!ec2_metadata_disabled) {
      AddProvider(
          Aws::MakeShared<Aws::Auth::InstanceProfileCredentialsProvider>(
              kAwsTag));
    }
  }
};

/// Requests stop as soon as the token is cancelled
template <typename RequestType>
void
AttachCancellation(
    RequestType* request, const integra::CancellationToken* token) {
  if (token == nullptr) {
    return;
  }
  request->SetContinueRequestHandler(
      [token](const Aws::Http::HttpRequest*) { return !token->IsCancelled(); });
}

template <class OutcomeType>
integra::Result<void>
CheckS3Error(
    const OutcomeType& outcome, const integra::CancellationToken* token,
    std::string_view op, const std::string& bucket, const std::string& key) {
  if (outcome.IsSuccess()) {
    return integra::ResultSuccess();
  }
  if (integra::IsCancelled(token)) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::Cancelled, "{} [{}] {} cancelled", op,
        bucket, key);
  }
  const auto& error = outcome.GetError();
  if (error.GetResponseCode() ==
      Aws::Http::HttpResponseCode::MOVED_PERMANENTLY) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::WrongRegion, "{} [{}] {}: {}", op, bucket,
        key, error.GetMessage());
  }
  return INTEGRA_ERROR(
      integra::UploadErrorCode::TransportError, "{} [{}] {}: {} ({}): {}", op,
      bucket, key, error.GetExceptionName(),
      static_cast<int>(error.GetResponseCode()), error.GetMessage());
}

std::optional<std::string>
OptionalChecksum(const Aws::String& s) {
  if (s.empty()) {
    return std::nullopt;
  }
  return std::string(integra::FromAwsString(s));
}

}  // namespace

integra::S3Api::S3Api() { Aws::InitAPI(options_); }

integra::S3Api::~S3Api() { Aws::ShutdownAPI(options_); }

integra::Result<std::unique_ptr<integra::S3ObjectStore>>
integra::S3ObjectStore::Make(
    const ClientSettings& settings, uint32_t max_connections) {
  Aws::Client::ClientConfiguration cfg;
  cfg.region = ToAwsString(
      settings.region.empty() ? std::string(kDefaultRegion) : settings.region);
  cfg.maxConnections = max_connections;

  // if false SDK will build "path-style" URLs if true the URLs will be
  // "virtual-host-style" URLs. LocalStack and MinIO only support the former
  // but they are deprecated for new buckets in S3.
  bool use_virtual_addressing = true;
  if (!settings.endpoint_url.empty()) {
    if (HasPrefix(settings.endpoint_url, "http://")) {
      cfg.scheme = Aws::Http::Scheme::HTTP;
    } else if (HasPrefix(settings.endpoint_url, "https://")) {
      cfg.scheme = Aws::Http::Scheme::HTTPS;
    } else {
      return INTEGRA_ERROR(
          UploadErrorCode::ConfigurationError,
          "endpoint url {} must start with http:// or https://",
          settings.endpoint_url);
    }
    cfg.endpointOverride = ToAwsString(settings.endpoint_url);
    use_virtual_addressing = false;
  }

  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials;
  if (settings.has_static_credentials()) {
    credentials = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
        kAwsTag, ToAwsString(settings.access_key),
        ToAwsString(settings.secret_key));
  } else {
    credentials = Aws::MakeShared<IntegraCredentialsChain>(kAwsTag);
  }

  auto client = Aws::MakeShared<Aws::S3::S3Client>(
      kAwsTag, credentials, cfg,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing);

  return std::unique_ptr<S3ObjectStore>(new S3ObjectStore(std::move(client)));
}

integra::Result<std::string>
integra::S3ObjectStore::CreateUpload(
    const ObjectRef& object, ChecksumAlgorithm algorithm,
    const CancellationToken* token) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.WithBucket(ToAwsString(object.bucket))
      .WithKey(ToAwsString(object.key))
      .WithContentType("application/octet-stream");
  if (algorithm == ChecksumAlgorithm::Crc32) {
    request.SetChecksumAlgorithm(Aws::S3::Model::ChecksumAlgorithm::CRC32);
  }
  AttachCancellation(&request, token);

  auto outcome = client_->CreateMultipartUpload(request);
  INTEGRA_CHECKED(CheckS3Error(
      outcome, token, "CreateMultipartUpload", object.bucket, object.key));

  return std::string(FromAwsString(outcome.GetResult().GetUploadId()));
}

integra::Result<integra::UploadPartResponse>
integra::S3ObjectStore::UploadPart(
    const UploadRef& upload, int32_t part_number, const uint8_t* body,
    uint64_t size, const std::string& checksum,
    const CancellationToken* token) {
  // The SDK never writes through the buffer
  static uint8_t kEmpty = 0;
  uint8_t* data = size > 0 ? const_cast<uint8_t*>(body) : &kEmpty;
  Aws::Utils::Stream::PreallocatedStreamBuf stream_buf(data, size);
  auto stream = Aws::MakeShared<Aws::IOStream>(kAwsTag, &stream_buf);

  Aws::S3::Model::UploadPartRequest request;
  request.WithBucket(ToAwsString(upload.bucket))
      .WithKey(ToAwsString(upload.key))
      .WithUploadId(ToAwsString(upload.upload_id))
      .WithPartNumber(part_number)
      .WithContentLength(static_cast<long long>(size));
  request.SetChecksumAlgorithm(Aws::S3::Model::ChecksumAlgorithm::CRC32);
  request.SetChecksumCRC32(ToAwsString(checksum));
  request.SetBody(stream);
  request.SetContentType("application/octet-stream");
  AttachCancellation(&request, token);

  auto outcome = client_->UploadPart(request);
  INTEGRA_CHECKED_CONTEXT(
      CheckS3Error(outcome, token, "UploadPart", upload.bucket, upload.key),
      "part {}", part_number);

  const auto& result = outcome.GetResult();
  UploadPartResponse response;
  response.etag = std::string(FromAwsString(result.GetETag()));
  response.checksum = OptionalChecksum(result.GetChecksumCRC32());
  return response;
}

integra::Result<std::vector<integra::ListedPart>>
integra::S3ObjectStore::ListParts(
    const UploadRef& upload, const CancellationToken* token) {
  std::vector<ListedPart> listed;

  // S3 returns at most 1000 parts per page
  int marker = 0;
  for (;;) {
    Aws::S3::Model::ListPartsRequest request;
    request.WithBucket(ToAwsString(upload.bucket))
        .WithKey(ToAwsString(upload.key))
        .WithUploadId(ToAwsString(upload.upload_id));
    if (marker > 0) {
      request.SetPartNumberMarker(marker);
    }
    AttachCancellation(&request, token);

    auto outcome = client_->ListParts(request);
    INTEGRA_CHECKED(
        CheckS3Error(outcome, token, "ListParts", upload.bucket, upload.key));

    const auto& result = outcome.GetResult();
    for (const auto& part : result.GetParts()) {
      ListedPart lp;
      lp.part_number = part.GetPartNumber();
      lp.size = static_cast<uint64_t>(part.GetSize());
      lp.etag = std::string(FromAwsString(part.GetETag()));
      lp.checksum = OptionalChecksum(part.GetChecksumCRC32());
      lp.last_modified = std::string(
          FromAwsString(part.GetLastModified().ToGmtString(
              Aws::Utils::DateFormat::ISO_8601)));
      listed.emplace_back(std::move(lp));
    }

    if (!result.GetIsTruncated() ||
        result.GetNextPartNumberMarker() <= marker) {
      break;
    }
    marker = result.GetNextPartNumberMarker();
  }

  return listed;
}

integra::Result<integra::CompleteUploadResponse>
integra::S3ObjectStore::CompleteUpload(
    const UploadRef& upload, const std::vector<CompletedPart>& parts,
    const std::string& object_checksum, const CancellationToken* token) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const CompletedPart& part : parts) {
    Aws::S3::Model::CompletedPart cp;
    cp.WithPartNumber(part.part_number).WithETag(ToAwsString(part.etag));
    cp.SetChecksumCRC32(ToAwsString(part.checksum));
    completed.AddParts(cp);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.WithBucket(ToAwsString(upload.bucket))
      .WithKey(ToAwsString(upload.key))
      .WithUploadId(ToAwsString(upload.upload_id))
      .WithMultipartUpload(completed);
  if (!object_checksum.empty()) {
    request.SetChecksumCRC32(ToAwsString(object_checksum));
  }
  AttachCancellation(&request, token);

  auto outcome = client_->CompleteMultipartUpload(request);
  INTEGRA_CHECKED(CheckS3Error(
      outcome, token, "CompleteMultipartUpload", upload.bucket, upload.key));

  const auto& result = outcome.GetResult();
  CompleteUploadResponse response;
  response.location = std::string(FromAwsString(result.GetLocation()));
  response.etag = std::string(FromAwsString(result.GetETag()));
  response.version_id = std::string(FromAwsString(result.GetVersionId()));
  response.checksum = OptionalChecksum(result.GetChecksumCRC32());
  return response;
}

integra::Result<void>
integra::S3ObjectStore::AbortUpload(const UploadRef& upload) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.WithBucket(ToAwsString(upload.bucket))
      .WithKey(ToAwsString(upload.key))
      .WithUploadId(ToAwsString(upload.upload_id));

  auto outcome = client_->AbortMultipartUpload(request);
  return CheckS3Error(
      outcome, nullptr, "AbortMultipartUpload", upload.bucket, upload.key);
}
