#ifndef __BLOCKSWORLD
#define __BLOCKSWORLD

#include <string>
#include <memory>

#include "../domain/domain.hpp"
#include "../state/state.hpp"

const std::string blocks_world_domain_name = "blocks_world";

/*
    Facts:
        - pos(b): table, hand or the block below b
        - clear(b): "true" when nothing is on top of b
        - holding(hand): the held block or "nothing"

    Goals use the pos predicate. The move_blocks multigoal method moves one block at a time
    toward its goal position and re-posts the multigoal
*/
std::shared_ptr<Domain> create_blocks_world_domain();

// Sussman anomaly: c on a, a and b on the table
State blocks_world_initial_state();

std::string block_status(const State& state, const std::string& block, const Multigoal& mg);

#endif
