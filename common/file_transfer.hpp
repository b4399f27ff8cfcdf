#pragma once

#include <cstdint>

namespace sat_payload {

/**
 * @brief Тип передаваемого файла
 */
enum class TransferType : uint8_t {
  None = 0,  ///< Передачи нет
  Image      ///< Снимок камеры
};

/**
 * @brief Трекер передачи файла от payload
 *
 * Хранит номер текущего запрашиваемого пакета. Payload нумерует пакеты с 1,
 * поэтому StartTransfer() устанавливает packet_nb = 1.
 *
 * @example
 * @code
 * FileTransfer ft;
 * ft.StartTransfer(TransferType::Image);
 * // ... пакет 1 сохранён
 * ft.AckPacket();  // packet_nb == 2
 * ft.StopTransfer();
 * @endcode
 */
class FileTransfer {
 public:
  FileTransfer() = default;

  /**
   * @brief Начать передачу
   * @param type Тип файла
   */
  void StartTransfer(TransferType type) noexcept;

  /**
   * @brief Подтвердить сохранение текущего пакета (packet_nb + 1)
   * @return false, если передача не активна (состояние не меняется)
   */
  [[nodiscard]] bool AckPacket() noexcept;

  /**
   * @brief Завершить передачу
   *
   * Запоминает тип передачи в LastTransferType() и сбрасывает состояние.
   */
  void StopTransfer() noexcept;

  /**
   * @brief Полный сброс, включая LastTransferType()
   */
  void Reset() noexcept;

  [[nodiscard]] bool InProgress() const noexcept { return in_progress_; }
  [[nodiscard]] uint32_t PacketNb() const noexcept { return packet_nb_; }
  [[nodiscard]] TransferType Type() const noexcept { return type_; }
  [[nodiscard]] TransferType LastTransferType() const noexcept {
    return last_transfer_type_;
  }

 private:
  bool in_progress_{false};
  uint32_t packet_nb_{0};
  TransferType type_{TransferType::None};
  TransferType last_transfer_type_{TransferType::None};
};

}  // namespace sat_payload
