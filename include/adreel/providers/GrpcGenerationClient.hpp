// Repository: AdReel
// Component: Generation gateway gRPC client
// Purpose: Production transport for every generation provider interface.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PROVIDERS_GRPC_GENERATION_CLIENT_HPP_
#define ADREEL_PROVIDERS_GRPC_GENERATION_CLIENT_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "adreel/generation/v1/generation.grpc.pb.h"

#include "adreel/providers/GenerationProviders.hpp"

namespace adreel::providers {

struct GatewayClientConfig {
  std::string target_address = "127.0.0.1:50061";
  std::string text_model = "gemini-2.5-flash";
  std::string image_model = "gemini-2.5-flash-image-preview";
  std::string video_model = "veo-2.0-generate-001";
  int rpc_timeout_ms = 120000;
};

// Unary, blocking calls against GenerationGateway. One channel per client.
// Transport failures surface as Result failures ("gateway unavailable: ...");
// provider-level failures keep the provider's wording.
class GrpcGenerationClient : public ITextModel,
                             public IImageGenerator,
                             public ISpeechSynthesizer,
                             public IVideoJobService {
 public:
  explicit GrpcGenerationClient(GatewayClientConfig config);

  util::Result<std::string> GenerateJson(const std::string& prompt) override;
  util::Result<media::MediaHandle> GenerateImage(const ImageRequest& request) override;
  util::Result<media::MediaHandle> Synthesize(const SpeechRequest& request) override;
  util::Result<JobHandle> Submit(const VideoJobRequest& request) override;
  util::Result<JobHandle> Poll(const JobHandle& handle) override;
  util::Result<media::MediaHandle> Fetch(const std::string& uri) override;

  const GatewayClientConfig& config() const { return config_; }

 private:
  void PrepareContext(grpc::ClientContext& context) const;

  GatewayClientConfig config_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<adreel::generation::v1::GenerationGateway::Stub> stub_;
};

}  // namespace adreel::providers

#endif  // ADREEL_PROVIDERS_GRPC_GENERATION_CLIENT_HPP_
