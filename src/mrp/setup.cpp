#include "tvremote/mrp/setup.hpp"
#include "tvremote/debug/log.hpp"
#include "tvremote/mrp/capabilities.hpp"
#include "tvremote/mrp/player_state.hpp"
#include "tvremote/mrp/protocol_session.hpp"

namespace tvremote::mrp {

namespace {

    AsyncResult<Unit> ConnectSession(std::shared_ptr<ProtocolSession> session,
                                     std::shared_ptr<PlayerStateManager> player_state) {
        TVREMOTE_CO_TRY(co_await session->Start());
        // The first SET_STATE may trail the start sequence; carry on without it.
        if (!co_await player_state->WaitForInitialState(session->Config().initial_state_wait)) {
            TVREMOTE_LOG_MSG("SETUP", "No initial player state received");
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

}

    std::map<std::string, std::string> DeviceInfoFields(const proto::mrp::ProtocolMessage& message) {
        std::map<std::string, std::string> fields;
        if (!message.has_deviceinfomessage()) {
            return fields;
        }
        const auto& info = message.deviceinfomessage();
        if (info.has_systembuildversion()) {
            fields.emplace("build_number", info.systembuildversion());
        }
        if (info.has_modelid()) {
            fields.emplace("model", info.modelid());
        }
        if (info.has_name()) {
            fields.emplace("name", info.name());
        }
        if (info.has_localizedmodelname()) {
            fields.emplace("model_name", info.localizedmodelname());
        }
        return fields;
    }

    RemoteResult<facade::SetupDescriptor> CreateSetup(
        boost::asio::io_context& io_context,
        const configuration::DeviceConfig& device,
        const configuration::ServiceInfo& service,
        const configuration::SessionConfig& config) {
        TVREMOTE_TRY(config.Validate());

        std::optional<auth::Credentials> credentials;
        if (!service.credentials.empty()) {
            auto parsed = auth::Credentials::Parse(service.credentials);
            TVREMOTE_TRY(parsed);
            credentials = std::move(parsed).Unwrap();
        }

        auto session = ProtocolSession::Create(
            io_context, device.address, service.port, config, std::move(credentials));
        auto player_state = std::make_shared<PlayerStateManager>(session);
        auto push_updater = std::make_shared<MrpPushUpdater>(player_state);
        auto features = std::make_shared<MrpFeatures>(player_state);

        facade::SetupDescriptor descriptor;
        descriptor.protocol = interfaces::ProtocolTag::Mrp;
        descriptor.capabilities.remote_control = std::make_shared<MrpRemoteControl>(session, player_state);
        descriptor.capabilities.metadata = std::make_shared<MrpMetadata>(device.identifier, player_state);
        descriptor.capabilities.power = std::make_shared<MrpPower>(session);
        descriptor.capabilities.push_updater = push_updater;
        descriptor.capabilities.audio = std::make_shared<MrpAudio>(session);
        descriptor.capabilities.features = features;

        for (const auto& entry : features->AllFeatures()) {
            descriptor.features.insert(entry.first);
        }

        descriptor.connect = [session, player_state]() {
            return ConnectSession(session, player_state);
        };
        descriptor.close = [session, push_updater]() {
            if (auto stopped = push_updater->Stop(); stopped.IsErr()) {
                TVREMOTE_LOG_WARN("SETUP", "Stopping push updates failed: " + stopped.UnwrapErr().Describe());
            }
            session->Stop();
            return facade::PendingTasks{};
        };
        descriptor.device_info = [session]() {
            if (!session->DeviceInfo()) {
                return std::map<std::string, std::string>{};
            }
            return DeviceInfoFields(*session->DeviceInfo());
        };
        descriptor.set_device_listener = [session](interfaces::DeviceListener* listener) {
            if (listener) {
                session->SetDeviceListener(listener);
            } else {
                session->ClearDeviceListener();
            }
        };
        return RemoteResult<facade::SetupDescriptor>::Ok(std::move(descriptor));
    }

}
