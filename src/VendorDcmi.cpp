/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "VendorDcmi.hpp"

#include "DcmiConfig.hpp"
#include "DcmiFunctions.hpp"
#include "DcmiInterface.hpp"
#include "DcmiRecords.hpp"
#include "NpuError.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>

namespace npu
{

namespace vendor
{

static_assert(MAX_CHIP_NAME_LEN == raw::chipNameLength);
static_assert(DIE_ID_COUNT == raw::dieIdCount);
static_assert(MAX_CORE_NUM == raw::maxCoreCount);
static_assert(sizeof(dcmi_elabel_info::product_name) == raw::elabelFieldLength);
static_assert(sizeof(dcmi_elabel_info::model) == raw::elabelFieldLength);
static_assert(sizeof(dcmi_elabel_info::manufacturer) == raw::elabelFieldLength);
static_assert(sizeof(dcmi_elabel_info::serial_number) ==
              raw::elabelFieldLength);
static_assert(sizeof(dcmi_create_vdev_res_stru::template_name) ==
              raw::templateNameLength);

static_assert(static_cast<int>(DCMI_ERR_CODE_INVALID_PARAMETER) ==
              static_cast<int>(StatusError::invalidParameter));
static_assert(static_cast<int>(DCMI_ERR_CODE_OPER_NOT_PERMITTED) ==
              static_cast<int>(StatusError::operationNotPermitted));
static_assert(static_cast<int>(DCMI_ERR_CODE_MEM_OPERATE_FAIL) ==
              static_cast<int>(StatusError::memoryOperationFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_SECURE_FUN_FAIL) ==
              static_cast<int>(StatusError::secureFunctionFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_INNER_ERR) ==
              static_cast<int>(StatusError::innerError));
static_assert(static_cast<int>(DCMI_ERR_CODE_TIME_OUT) ==
              static_cast<int>(StatusError::timeOut));
static_assert(static_cast<int>(DCMI_ERR_CODE_INVALID_DEVICE_ID) ==
              static_cast<int>(StatusError::invalidDeviceId));
static_assert(static_cast<int>(DCMI_ERR_CODE_DEVICE_NOT_EXIST) ==
              static_cast<int>(StatusError::deviceNotExist));
static_assert(static_cast<int>(DCMI_ERR_CODE_IOCTL_FAIL) ==
              static_cast<int>(StatusError::ioctlFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_SEND_MSG_FAIL) ==
              static_cast<int>(StatusError::sendMessageFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_RECV_MSG_FAIL) ==
              static_cast<int>(StatusError::receiveMessageFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_NOT_REDAY) ==
              static_cast<int>(StatusError::notReady));
static_assert(static_cast<int>(DCMI_ERR_CODE_NOT_SUPPORT_IN_CONTAINER) ==
              static_cast<int>(StatusError::notSupportedInContainer));
static_assert(static_cast<int>(DCMI_ERR_CODE_RESET_FAIL) ==
              static_cast<int>(StatusError::resetFailed));
static_assert(static_cast<int>(DCMI_ERR_CODE_ABORT_OPERATE) ==
              static_cast<int>(StatusError::abortOperation));
static_assert(static_cast<int>(DCMI_ERR_CODE_IS_UPGRADING) ==
              static_cast<int>(StatusError::isUpgrading));
static_assert(static_cast<int>(DCMI_ERR_CODE_RESOURCE_OCCUPIED) ==
              static_cast<int>(StatusError::resourceOccupied));
static_assert(static_cast<int>(DCMI_ERR_CODE_NOT_SUPPORT) ==
              static_cast<int>(StatusError::notSupported));

namespace
{

template <size_t N, typename Fn, typename T>
Argument<Fn, N> argumentAs(Fn /*fn*/, T value)
{
    return static_cast<Argument<Fn, N>>(value);
}

// Vendor and record arrays may differ in length; the shorter one wins
template <typename Src, size_t N, typename Dst, size_t M>
void copyArray(const Src (&src)[N], std::array<Dst, M>& dst)
{
    std::transform(src, src + std::min(N, M), dst.begin(),
                   [](Src v) { return static_cast<Dst>(v); });
}

template <typename Src, size_t N, typename Dst, size_t M>
void copyArray(const std::array<Src, N>& src, Dst (&dst)[M])
{
    std::transform(src.begin(), src.begin() + std::min(N, M), dst,
                   [](Src v) { return static_cast<Dst>(v); });
}

template <typename Record>
void copyPcieFields(const Record& src, raw::PcieInfo& dst)
{
    dst.deviceId = static_cast<uint32_t>(src.deviceid);
    dst.venderId = static_cast<uint32_t>(src.venderid);
    dst.subvenderId = static_cast<uint32_t>(src.subvenderid);
    dst.subdeviceId = static_cast<uint32_t>(src.subdeviceid);
    dst.bdfDeviceId = static_cast<uint32_t>(src.bdf_deviceid);
    dst.bdfBusId = static_cast<uint32_t>(src.bdf_busid);
    dst.bdfFuncId = static_cast<uint32_t>(src.bdf_funcid);
}

/**
 * @brief DcmiInterface over a table of vendor entry points.
 *
 * Vendor structures are zero-filled before each call and copied field by
 * field into the matching raw record afterwards.
 */
class VendorDcmi final : public DcmiInterface
{
  public:
    VendorDcmi(DcmiFunctions functions,
               std::shared_ptr<const LoadedLibrary> library) :
        fn(functions), library(std::move(library))
    {}

    int init() override
    {
        return fn.dcmi_init();
    }

    int getDcmiVersion(std::span<char> version) override
    {
        return fn.dcmi_get_dcmi_version(
            version.data(),
            argumentAs<1>(fn.dcmi_get_dcmi_version, version.size()));
    }

    int getDriverVersion(std::span<char> version) override
    {
        return fn.dcmi_get_driver_version(
            version.data(),
            argumentAs<1>(fn.dcmi_get_driver_version, version.size()));
    }

    int getVersion(int cardId, int deviceId, std::span<char> version,
                   int& length) override
    {
        return fn.dcmi_get_version(
            cardId, deviceId, version.data(),
            argumentAs<3>(fn.dcmi_get_version, version.size()), &length);
    }

    int getCardList(int& cardCount, std::span<int> cardList) override
    {
        return fn.dcmi_get_card_list(
            &cardCount, cardList.data(),
            argumentAs<2>(fn.dcmi_get_card_list, cardList.size()));
    }

    int getDeviceNumInCard(int cardId, int& deviceNum) override
    {
        return fn.dcmi_get_device_num_in_card(cardId, &deviceNum);
    }

    int getDeviceIdInCard(int cardId, int& deviceIdMax, int& mcuId,
                          int& cpuId) override
    {
        return fn.dcmi_get_device_id_in_card(cardId, &deviceIdMax, &mcuId,
                                             &cpuId);
    }

    int getDeviceType(int cardId, int deviceId, uint32_t& unitType) override
    {
        std::remove_pointer_t<Argument<decltype(fn.dcmi_get_device_type), 2>>
            type{};
        int rc = fn.dcmi_get_device_type(cardId, deviceId, &type);
        unitType = static_cast<uint32_t>(type);
        return rc;
    }

    int getDeviceChipInfo(int cardId, int deviceId,
                          raw::ChipInfo& info) override
    {
        dcmi_chip_info chip{};
        int rc = fn.dcmi_get_device_chip_info(cardId, deviceId, &chip);
        copyArray(chip.chip_type, info.chipType);
        copyArray(chip.chip_name, info.chipName);
        copyArray(chip.chip_ver, info.chipVersion);
        info.aicoreCount = static_cast<uint32_t>(chip.aicore_cnt);
        return rc;
    }

    int getDevicePcieInfo(int cardId, int deviceId,
                          raw::PcieInfo& info) override
    {
        dcmi_pcie_info pcie{};
        int rc = fn.dcmi_get_device_pcie_info(cardId, deviceId, &pcie);
        copyPcieFields(pcie, info);
        return rc;
    }

    int getDevicePcieInfoV2(int cardId, int deviceId,
                            raw::PcieInfoAll& info) override
    {
        dcmi_pcie_info_all pcie{};
        int rc = fn.dcmi_get_device_pcie_info_v2(cardId, deviceId, &pcie);
        copyPcieFields(pcie, info.base);
        info.domain = static_cast<int32_t>(pcie.domain);
        return rc;
    }

    int getDeviceBoardInfo(int cardId, int deviceId,
                           raw::BoardInfo& info) override
    {
        dcmi_board_info board{};
        int rc = fn.dcmi_get_device_board_info(cardId, deviceId, &board);
        info.boardId = static_cast<uint32_t>(board.board_id);
        info.pcbId = static_cast<uint32_t>(board.pcb_id);
        info.bomId = static_cast<uint32_t>(board.bom_id);
        info.slotId = static_cast<uint32_t>(board.slot_id);
        return rc;
    }

    int getDeviceElabelInfo(int cardId, int deviceId,
                            raw::ElabelInfo& info) override
    {
        dcmi_elabel_info elabel{};
        int rc = fn.dcmi_get_device_elabel_info(cardId, deviceId, &elabel);
        copyArray(elabel.product_name, info.productName);
        copyArray(elabel.model, info.model);
        copyArray(elabel.manufacturer, info.manufacturer);
        copyArray(elabel.serial_number, info.serialNumber);
        return rc;
    }

    int getDevicePowerInfo(int cardId, int deviceId, int& power) override
    {
        return fn.dcmi_get_device_power_info(cardId, deviceId, &power);
    }

    int getDeviceDieV2(int cardId, int deviceId, uint32_t dieType,
                       raw::DieId& dieId) override
    {
        dcmi_die_id die{};
        int rc = fn.dcmi_get_device_die_v2(
            cardId, deviceId, argumentAs<2>(fn.dcmi_get_device_die_v2, dieType),
            &die);
        copyArray(die.soc_die, dieId.socDie);
        return rc;
    }

    int getDeviceHealth(int cardId, int deviceId, uint32_t& health) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_health(cardId, deviceId, &value);
        health = value;
        return rc;
    }

    int getDriverHealth(uint32_t& health) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_driver_health(&value);
        health = value;
        return rc;
    }

    int getDeviceErrorCodeV2(int cardId, int deviceId, int& errorCount,
                             std::span<uint32_t> errorCodes) override
    {
        return fn.dcmi_get_device_errorcode_v2(
            cardId, deviceId, &errorCount, errorCodes.data(),
            argumentAs<4>(fn.dcmi_get_device_errorcode_v2, errorCodes.size()));
    }

    int getDeviceErrorCodeString(int cardId, int deviceId, uint32_t errorCode,
                                 std::span<uint8_t> info) override
    {
        return fn.dcmi_get_device_errorcode_string(
            cardId, deviceId, errorCode, info.data(),
            argumentAs<4>(fn.dcmi_get_device_errorcode_string, info.size()));
    }

    int getDeviceFlashCount(int cardId, int deviceId, uint32_t& count) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_flash_count(cardId, deviceId, &value);
        count = value;
        return rc;
    }

    int getDeviceFlashInfoV2(int cardId, int deviceId, uint32_t flashIndex,
                             raw::FlashInfo& info) override
    {
        dcmi_flash_info flash{};
        int rc = fn.dcmi_get_device_flash_info_v2(cardId, deviceId, flashIndex,
                                                  &flash);
        info.flashId = static_cast<uint64_t>(flash.flash_id);
        info.deviceId = static_cast<uint16_t>(flash.device_id);
        info.vendor = static_cast<uint16_t>(flash.vendor);
        info.state = static_cast<uint32_t>(flash.state);
        info.size = static_cast<uint64_t>(flash.size);
        info.sectorCount = static_cast<uint32_t>(flash.sector_count);
        info.manufacturerId = static_cast<uint16_t>(flash.manufacturer_id);
        return rc;
    }

    int getDeviceAicoreInfo(int cardId, int deviceId,
                            raw::AicoreInfo& info) override
    {
        dcmi_aicore_info aicore{};
        int rc = fn.dcmi_get_device_aicore_info(cardId, deviceId, &aicore);
        info.freq = static_cast<uint32_t>(aicore.freq);
        info.curFreq = static_cast<uint32_t>(aicore.cur_freq);
        return rc;
    }

    int getDeviceAicpuInfo(int cardId, int deviceId,
                           raw::AicpuInfo& info) override
    {
        dcmi_aicpu_info aicpu{};
        int rc = fn.dcmi_get_device_aicpu_info(cardId, deviceId, &aicpu);
        info.maxFreq = static_cast<uint32_t>(aicpu.max_freq);
        info.curFreq = static_cast<uint32_t>(aicpu.cur_freq);
        info.aicpuNum = static_cast<uint32_t>(aicpu.aicpu_num);
        copyArray(aicpu.util_rate, info.utilRate);
        return rc;
    }

    int getDeviceSystemTime(int cardId, int deviceId, uint32_t& time) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_system_time(cardId, deviceId, &value);
        time = value;
        return rc;
    }

    int getDeviceTemperature(int cardId, int deviceId,
                             int& temperature) override
    {
        return fn.dcmi_get_device_temperature(cardId, deviceId, &temperature);
    }

    int getDeviceVoltage(int cardId, int deviceId, uint32_t& voltage) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_voltage(cardId, deviceId, &value);
        voltage = value;
        return rc;
    }

    int getDevicePcieErrorCnt(int cardId, int deviceId,
                              raw::PcieErrorRate& rate) override
    {
        dcmi_chip_pcie_err_rate err{};
        int rc = fn.dcmi_get_device_pcie_error_cnt(cardId, deviceId, &err);
        rate.deskewFifoOverflowIntrStatus =
            static_cast<uint32_t>(err.reg_deskew_fifo_overflow_intr_status);
        rate.symbolUnlockIntrStatus =
            static_cast<uint32_t>(err.reg_symbol_unlock_intr_status);
        rate.deskewUnlockIntrStatus =
            static_cast<uint32_t>(err.reg_deskew_unlock_intr_status);
        rate.phystatusTimeoutIntrStatus =
            static_cast<uint32_t>(err.reg_phystatus_timeout_intr_status);
        rate.symbolUnlockCounter =
            static_cast<uint32_t>(err.symbol_unlock_counter);
        rate.pcsRxErrCnt = static_cast<uint32_t>(err.pcs_rx_err_cnt);
        rate.phyLaneErrCounter =
            static_cast<uint32_t>(err.phy_lane_err_counter);
        rate.pcsRcvErrStatus = static_cast<uint32_t>(err.pcs_rcv_err_status);
        rate.symbolUnlockErrStatus =
            static_cast<uint32_t>(err.symbol_unlock_err_status);
        rate.phyLaneErrStatus = static_cast<uint32_t>(err.phy_lane_err_status);
        rate.dlLcrcErrNum = static_cast<uint32_t>(err.dl_lcrc_err_num);
        rate.dlDcrcErrNum = static_cast<uint32_t>(err.dl_dcrc_err_num);
        return rc;
    }

    int getDeviceEccInfo(int cardId, int deviceId, uint32_t deviceType,
                         raw::EccInfo& info) override
    {
        dcmi_ecc_info ecc{};
        int rc = fn.dcmi_get_device_ecc_info(
            cardId, deviceId,
            argumentAs<2>(fn.dcmi_get_device_ecc_info, deviceType), &ecc);
        info.enableFlag = static_cast<int32_t>(ecc.enable_flag);
        info.singleBitErrorCnt =
            static_cast<uint32_t>(ecc.single_bit_error_cnt);
        info.doubleBitErrorCnt =
            static_cast<uint32_t>(ecc.double_bit_error_cnt);
        info.totalSingleBitErrorCnt =
            static_cast<uint32_t>(ecc.total_single_bit_error_cnt);
        info.totalDoubleBitErrorCnt =
            static_cast<uint32_t>(ecc.total_double_bit_error_cnt);
        info.singleBitIsolatedPagesCnt =
            static_cast<uint32_t>(ecc.single_bit_isolated_pages_cnt);
        info.doubleBitIsolatedPagesCnt =
            static_cast<uint32_t>(ecc.double_bit_isolated_pages_cnt);
        return rc;
    }

    int getDeviceFrequency(int cardId, int deviceId, uint32_t frequencyType,
                           uint32_t& frequency) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_frequency(
            cardId, deviceId,
            argumentAs<2>(fn.dcmi_get_device_frequency, frequencyType), &value);
        frequency = value;
        return rc;
    }

    int getDeviceHbmInfo(int cardId, int deviceId, raw::HbmInfo& info) override
    {
        dcmi_hbm_info hbm{};
        int rc = fn.dcmi_get_device_hbm_info(cardId, deviceId, &hbm);
        info.memorySize = static_cast<uint64_t>(hbm.memory_size);
        info.freq = static_cast<uint32_t>(hbm.freq);
        info.memoryUsage = static_cast<uint64_t>(hbm.memory_usage);
        info.temp = static_cast<int32_t>(hbm.temp);
        info.bandwidthUtilRate = static_cast<uint32_t>(hbm.bandwith_util_rate);
        return rc;
    }

    int getDeviceMemoryInfoV3(int cardId, int deviceId,
                              raw::MemoryInfo& info) override
    {
        dcmi_get_memory_info_stru memory{};
        int rc = fn.dcmi_get_device_memory_info_v3(cardId, deviceId, &memory);
        info.memorySize = static_cast<uint64_t>(memory.memory_size);
        info.memoryAvailable = static_cast<uint64_t>(memory.memory_available);
        info.freq = static_cast<uint32_t>(memory.freq);
        info.hugePageSize = static_cast<uint64_t>(memory.hugepagesize);
        info.hugePagesTotal = static_cast<uint64_t>(memory.hugepages_total);
        info.hugePagesFree = static_cast<uint64_t>(memory.hugepages_free);
        info.utilization = static_cast<uint32_t>(memory.utiliza);
        return rc;
    }

    int getDeviceUtilizationRate(int cardId, int deviceId, int inputType,
                                 uint32_t& utilization) override
    {
        unsigned int value = 0;
        int rc = fn.dcmi_get_device_utilization_rate(cardId, deviceId,
                                                     inputType, &value);
        utilization = value;
        return rc;
    }

    int createVdevice(int cardId, int deviceId,
                      const raw::CreateVdevRes& request,
                      raw::CreateVdevOut& out) override
    {
        dcmi_create_vdev_res_stru res{};
        res.vdev_id = request.vdevId;
        res.vfg_id = request.vfgId;
        copyArray(request.templateName, res.template_name);

        dcmi_create_vdev_out created{};
        int rc = fn.dcmi_create_vdevice(cardId, deviceId, &res, &created);
        out.vdevId = static_cast<uint32_t>(created.vdev_id);
        out.pcieBus = static_cast<uint32_t>(created.pcie_bus);
        out.pcieDevice = static_cast<uint32_t>(created.pcie_device);
        out.pcieFunc = static_cast<uint32_t>(created.pcie_func);
        out.vfgId = static_cast<uint32_t>(created.vfg_id);
        return rc;
    }

    int setDestroyVdevice(int cardId, int deviceId, uint32_t vdevId) override
    {
        return fn.dcmi_set_destroy_vdevice(cardId, deviceId, vdevId);
    }

  private:
    DcmiFunctions fn;
    // Keeps the dlopen handle alive for the dynamic backend
    std::shared_ptr<const LoadedLibrary> library;
};

} // namespace

} // namespace vendor

bool linkedBackendAvailable()
{
    return vendor::linkedFunctions().has_value();
}

std::shared_ptr<DcmiInterface> makeDcmiInterface(const config::Config& config)
{
    if (config.backend == config::Backend::linked)
    {
        auto functions = vendor::linkedFunctions();
        if (!functions)
        {
            lg2::error("Linked DCMI backend was not built");
            throw std::system_error(
                std::make_error_code(std::errc::function_not_supported),
                "linked DCMI backend not built");
        }
        lg2::info("Using linked DCMI library");
        return std::make_shared<vendor::VendorDcmi>(*functions, nullptr);
    }

    auto library =
        std::make_shared<const vendor::LoadedLibrary>(config.libraryPath());
    auto functions = library->functions();
    return std::make_shared<vendor::VendorDcmi>(functions, std::move(library));
}

} // namespace npu
