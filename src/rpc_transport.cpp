#include "portico/transport.hpp"

#include "portico/logging.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "rpc_transport";

/// Status codes that mean the engine looked at the request and refused it.
bool is_rejection(grpc::StatusCode code) {
    return code == grpc::StatusCode::INVALID_ARGUMENT ||
           code == grpc::StatusCode::FAILED_PRECONDITION ||
           code == grpc::StatusCode::NOT_FOUND;
}

} // namespace

RpcTransport::RpcTransport(TransportOptions options)
    : options_(std::move(options)) {}

void RpcTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stub_) return;

    auto channel = grpc::CreateChannel(options_.endpoint(), grpc::InsecureChannelCredentials());
    auto deadline = std::chrono::system_clock::now() + options_.connect_timeout;
    if (!channel->WaitForConnected(deadline)) {
        throw ConnectError("cannot connect to " + options_.endpoint() + ": channel not ready");
    }
    channel_ = std::move(channel);
    stub_ = BridgeService::NewStub(channel_);
    log_info(COMPONENT, "connected", {{"endpoint", options_.endpoint()}});
}

bool RpcTransport::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stub_ != nullptr;
}

void RpcTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stub_) return;
    stub_.reset();
    channel_.reset();
    log_info(COMPONENT, "disconnected", {{"endpoint", options_.endpoint()}});
}

std::shared_ptr<BridgeService::Stub> RpcTransport::stub() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stub_) return stub_;
    }
    connect();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stub_) {
        throw ConnectError("connection to " + options_.endpoint() + " closed");
    }
    return stub_;
}

void RpcTransport::configure(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + options_.request_timeout);
}

EngineResponse RpcTransport::finish(const grpc::Status& status, EngineResponse response,
                                    const std::string& method) {
    if (status.ok()) {
        return response;
    }
    if (is_rejection(status.error_code())) {
        EngineResponse rejected;
        rejected.set_success(false);
        rejected.set_message(status.error_message());
        return rejected;
    }
    log_warn(COMPONENT, "rpc_failed",
             {{"method", method},
              {"code", static_cast<int>(status.error_code())},
              {"error", status.error_message()}});
    if (status.error_code() == grpc::StatusCode::UNAVAILABLE) {
        close();
    }
    throw GrpcError(method + ": " + status.error_message(), status.error_code());
}

EngineResponse RpcTransport::init_server() {
    auto client = stub();
    ServerInitRequest request;
    request.set_server_init(true);
    EngineResponse response;
    grpc::ClientContext context;
    configure(context);
    auto status = client->InitServer(&context, request, &response);
    return finish(status, std::move(response), "InitServer");
}

EngineResponse RpcTransport::exchange(const SignalRequest& request) {
    auto client = stub();
    EngineResponse response;
    grpc::ClientContext context;
    configure(context);

    // Signal rows go to ProcessSignal whatever command they carry.
    if (request.source() == ENTITY_ROW && request.has_command()) {
        switch (request.command().operation()) {
            case CREATE: {
                auto status = client->CreateEntity(&context, request, &response);
                return finish(status, std::move(response), "CreateEntity");
            }
            case UPDATE: {
                auto status = client->UpdateEntity(&context, request, &response);
                return finish(status, std::move(response), "UpdateEntity");
            }
            case DELETE: {
                auto status = client->DeleteEntity(&context, request, &response);
                return finish(status, std::move(response), "DeleteEntity");
            }
            default:
                break;
        }
    }
    auto status = client->ProcessSignal(&context, request, &response);
    return finish(status, std::move(response), "ProcessSignal");
}

} // namespace portico
