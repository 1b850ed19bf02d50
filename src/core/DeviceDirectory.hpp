#pragma once
#include <mirror-launcher/Types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace mirror_launcher {

class BridgeTool;

struct Enumeration {
    std::vector<DeviceRecord> devices;
    ToolStatus status{ToolStatus::Ok};
};

// Lists the devices adb reports as ready. Stateless apart from the bridge
// tool handle, so concurrent enumerate() calls are allowed.
class DeviceDirectory {
public:
    explicit DeviceDirectory(std::shared_ptr<const BridgeTool> bridge);
    ~DeviceDirectory();

    Enumeration enumerate(Language language) const;

    DeviceRecord describe(const std::string& serial, Language language) const;

    static std::string makeDisplayLabel(const std::string& serial,
                                        const std::string& manufacturer,
                                        const std::string& model,
                                        bool queryTimedOut,
                                        Language language);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
