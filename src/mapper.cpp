#include "mapper.hpp"
#include "mappers/mapper000.hpp"
#include <iostream>
#include <sstream>

Mapper::Mapper(std::shared_ptr<Cartridge> cart) : cartridge(std::move(cart)) {
}

std::unique_ptr<Mapper> Mapper::create(std::shared_ptr<Cartridge> cart) {
    uint8_t id = cart->get_mapper_id();

    switch (id) {
        case 0:
            std::cout << "Using Mapper 0 (NROM) - No bank switching" << std::endl;
            return std::make_unique<Mapper000>(std::move(cart));

        default: {
            std::ostringstream msg;
            msg << "Unsupported mapper " << (int)id;
            throw RomError(RomError::Kind::UnsupportedMapper, msg.str(), id);
        }
    }
}
