// Repository: AdReel
// Component: Generation gateway gRPC client
// Purpose: Maps provider requests onto GenerationGateway RPCs.
// Copyright (c) 2026 AdReel

#include "adreel/providers/GrpcGenerationClient.hpp"

#include <chrono>
#include <vector>

#include "adreel/util/Logger.hpp"

namespace adreel::providers {

namespace proto = adreel::generation::v1;

namespace {

std::string TransportError(const grpc::Status& status) {
  return "gateway unavailable: " + status.error_message() + " (code " +
         std::to_string(static_cast<int>(status.error_code())) + ")";
}

bool IsHttpSuccess(int status) { return status >= 200 && status < 300; }

void ToPayload(const media::MediaHandle& blob, proto::MediaPayload* out) {
  out->set_mime_type(blob->mime_type);
  out->set_data(reinterpret_cast<const char*>(blob->bytes.data()),
                blob->bytes.size());
}

media::MediaHandle FromPayload(const proto::MediaPayload& payload,
                               const std::string& default_mime) {
  std::vector<uint8_t> bytes(payload.data().begin(), payload.data().end());
  return media::MakeMediaHandle(
      payload.mime_type().empty() ? default_mime : payload.mime_type(),
      std::move(bytes));
}

JobHandle ToHandle(const proto::VideoJob& job) {
  JobHandle handle;
  handle.name = job.name();
  handle.done = job.done();
  if (job.has_error() &&
      (job.error().code() != 0 || !job.error().message().empty())) {
    handle.has_error = true;
    handle.error_message = job.error().message();
  }
  if (job.videos_size() > 0) {
    handle.result_uri = job.videos(0).uri();
  }
  return handle;
}

}  // namespace

GrpcGenerationClient::GrpcGenerationClient(GatewayClientConfig config)
    : config_(std::move(config)),
      channel_(grpc::CreateChannel(config_.target_address,
                                   grpc::InsecureChannelCredentials())),
      stub_(proto::GenerationGateway::NewStub(channel_)) {
  util::Logger::Info("[GenerationClient] Channel created target=" +
                     config_.target_address);
}

void GrpcGenerationClient::PrepareContext(grpc::ClientContext& context) const {
  if (config_.rpc_timeout_ms > 0) {
    context.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::milliseconds(config_.rpc_timeout_ms));
  }
}

util::Result<std::string> GrpcGenerationClient::GenerateJson(
    const std::string& prompt) {
  using R = util::Result<std::string>;
  proto::GenerateTextRequest request;
  request.set_model(config_.text_model);
  request.set_prompt(prompt);
  request.set_response_mime_type("application/json");

  proto::GenerateTextResponse response;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->GenerateText(&context, request, &response);
  if (!status.ok()) return R::Failure(TransportError(status));
  if (response.text().empty()) return R::Failure("text model returned no content");
  return R::Success(response.text());
}

util::Result<media::MediaHandle> GrpcGenerationClient::GenerateImage(
    const ImageRequest& request) {
  using R = util::Result<media::MediaHandle>;
  proto::GenerateImageRequest rpc;
  rpc.set_model(config_.image_model);
  rpc.set_prompt(request.prompt);
  if (request.logo && !request.logo->empty()) {
    ToPayload(request.logo, rpc.mutable_reference_image());
  }

  proto::GenerateImageResponse response;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->GenerateImage(&context, rpc, &response);
  if (!status.ok()) return R::Failure(TransportError(status));

  for (const auto& part : response.parts()) {
    if (part.has_inline_data() && !part.inline_data().data().empty()) {
      return R::Success(FromPayload(part.inline_data(), "image/png"));
    }
  }
  return R::Failure(
      "Model did not return an image part. The prompt may have been blocked.");
}

util::Result<media::MediaHandle> GrpcGenerationClient::Synthesize(
    const SpeechRequest& request) {
  using R = util::Result<media::MediaHandle>;
  proto::SynthesizeSpeechRequest rpc;
  rpc.set_voice_id(request.voice_id);
  rpc.set_text(request.text);
  rpc.set_model_id(request.model_id);
  rpc.set_stability(request.stability);
  rpc.set_similarity_boost(request.similarity_boost);
  rpc.set_accept("audio/mpeg");

  proto::SynthesizeSpeechResponse response;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->SynthesizeSpeech(&context, rpc, &response);
  if (!status.ok()) return R::Failure(TransportError(status));

  if (!IsHttpSuccess(response.http_status())) {
    return R::Failure("TTS provider error: " + response.status_text() + " - " +
                      response.error_body());
  }
  if (response.audio().data().empty()) {
    return R::Failure("TTS provider returned empty audio");
  }
  return R::Success(FromPayload(response.audio(), "audio/mpeg"));
}

util::Result<JobHandle> GrpcGenerationClient::Submit(
    const VideoJobRequest& request) {
  using R = util::Result<JobHandle>;
  proto::SubmitVideoJobRequest rpc;
  rpc.set_model(config_.video_model);
  rpc.set_prompt(request.prompt);
  rpc.set_number_of_videos(request.number_of_videos);
  if (request.image && !request.image->empty()) {
    ToPayload(request.image, rpc.mutable_image());
    rpc.mutable_image()->set_mime_type("image/png");
  }

  proto::VideoJob job;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->SubmitVideoJob(&context, rpc, &job);
  if (!status.ok()) return R::Failure(TransportError(status));
  if (job.name().empty() && !job.done()) {
    return R::Failure("video job submission returned no job name");
  }
  return R::Success(ToHandle(job));
}

util::Result<JobHandle> GrpcGenerationClient::Poll(const JobHandle& handle) {
  using R = util::Result<JobHandle>;
  proto::GetVideoJobRequest rpc;
  rpc.set_name(handle.name);

  proto::VideoJob job;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->GetVideoJob(&context, rpc, &job);
  if (!status.ok()) return R::Failure(TransportError(status));
  JobHandle next = ToHandle(job);
  if (next.name.empty()) next.name = handle.name;
  return R::Success(next);
}

util::Result<media::MediaHandle> GrpcGenerationClient::Fetch(
    const std::string& uri) {
  using R = util::Result<media::MediaHandle>;
  proto::FetchMediaRequest rpc;
  rpc.set_uri(uri);

  proto::FetchMediaResponse response;
  grpc::ClientContext context;
  PrepareContext(context);
  grpc::Status status = stub_->FetchMedia(&context, rpc, &response);
  if (!status.ok()) return R::Failure(TransportError(status));
  if (!IsHttpSuccess(response.http_status())) {
    return R::Failure(response.status_text());
  }
  if (response.media().data().empty()) {
    return R::Failure("empty response body");
  }
  return R::Success(FromPayload(response.media(), "video/mp4"));
}

}  // namespace adreel::providers
