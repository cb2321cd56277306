#pragma once

#include "bt/DeviceRegistry.hpp"
#include <memory>
#include <optional>
#include <string>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
/**
 * A local HCI controller like "hci0".
 **/
class HciAdapter : public Adapter {
 private:
    const int devId;
    const std::string name;

 public:
    HciAdapter(int devId, std::string&& name);
    HciAdapter(HciAdapter&&) = delete;
    HciAdapter(const HciAdapter&) = delete;
    HciAdapter& operator=(HciAdapter&&) = delete;
    HciAdapter& operator=(const HciAdapter&) = delete;
    ~HciAdapter() override = default;

    /**
     * Looks up the adapter with the given name.
     * An empty name selects the default adapter.
     * Returns nullptr in case no such adapter exists.
     **/
    static std::shared_ptr<HciAdapter> open(const std::string& name);

    [[nodiscard]] std::string get_name() const override;
    /**
     * Brings the controller up or down.
     * Requires CAP_NET_ADMIN.
     **/
    bool set_powered(bool powered) override;
    /**
     * The public address of the controller in the "AA:BB:CC:DD:EE:FF" form.
     **/
    [[nodiscard]] std::optional<std::string> get_address() const;
    [[nodiscard]] int get_dev_id() const;
};
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
