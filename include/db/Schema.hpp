#pragma once

#include "config/Config.hpp"

namespace mv::db {

class Transactions;

// Creates the users and media tables and their indexes when missing
void initTables(Transactions& txns, const config::DatabaseConfig& cfg);

}
