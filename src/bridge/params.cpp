#include <portage/bridge/params.hpp>

namespace portage::bridge {

uint64_t derive_external_height(const params& params, uint64_t block_time) {
  if (params.l2_block_interval == 0 || block_time <= params.l2_genesis_time) {
    return 1;
  }
  auto elapsed_blocks =
      (block_time - params.l2_genesis_time) / params.l2_block_interval;
  if (elapsed_blocks <= params.finality_margin + 1) {
    return 1;
  }
  return elapsed_blocks - params.finality_margin;
}

}  // namespace portage::bridge
