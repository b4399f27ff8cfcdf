#include "file_transfer.hpp"

namespace sat_payload {

void FileTransfer::StartTransfer(TransferType type) noexcept {
  in_progress_ = true;
  packet_nb_ = 1;  // Первый пакет на стороне payload имеет номер 1
  type_ = type;
}

bool FileTransfer::AckPacket() noexcept {
  if (!in_progress_) {
    return false;
  }
  packet_nb_++;
  return true;
}

void FileTransfer::StopTransfer() noexcept {
  last_transfer_type_ = type_;
  in_progress_ = false;
  packet_nb_ = 0;
  type_ = TransferType::None;
}

void FileTransfer::Reset() noexcept {
  in_progress_ = false;
  packet_nb_ = 0;
  type_ = TransferType::None;
  last_transfer_type_ = TransferType::None;
}

}  // namespace sat_payload
