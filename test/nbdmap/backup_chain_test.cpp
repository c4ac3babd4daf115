#include <doctest/doctest.h>

#include "nbdmap/chain/backup_chain.hpp"

using namespace nbdmap;

TEST_CASE("backup chain assigns kinds by position") {
  auto chain = chain::backup_chain::from_list("full.data, inc1.data,inc2.data");
  REQUIRE(chain.ok());
  REQUIRE(chain.value.size() == 3);
  CHECK(chain.value.full().path == "full.data");
  CHECK(chain.value.full().kind == chain::file_kind::full);
  CHECK(chain.value.files()[1].path == "inc1.data");
  CHECK(chain.value.files()[1].kind == chain::file_kind::incremental);
  CHECK(chain.value.files()[2].sequence == 2);
  CHECK(chain.value.has_incrementals());
}

TEST_CASE("single file chain has no incrementals") {
  auto chain = chain::backup_chain::from_list("full.data");
  REQUIRE(chain.ok());
  CHECK(chain.value.size() == 1);
  CHECK_FALSE(chain.value.has_incrementals());
}

TEST_CASE("empty chains are rejected") {
  CHECK(chain::backup_chain::from_list("").status.code == error_code::chain_error);
  CHECK(chain::backup_chain::from_list(" , ").status.code == error_code::chain_error);
  CHECK(chain::backup_chain::from_paths({}).status.code == error_code::chain_error);
}

TEST_CASE("chains must start with a full backup") {
  std::vector<chain::file_ref> refs = {
      {"inc1.data", 0, chain::file_kind::incremental},
      {"inc2.data", 1, chain::file_kind::incremental},
  };
  CHECK(chain::backup_chain::from_refs(refs).status.code == error_code::chain_error);
}

TEST_CASE("chains allow only one full backup") {
  std::vector<chain::file_ref> refs = {
      {"full.data", 0, chain::file_kind::full},
      {"full2.data", 1, chain::file_kind::full},
  };
  CHECK(chain::backup_chain::from_refs(refs).status.code == error_code::chain_error);
}

TEST_CASE("chain sequences must strictly increase") {
  std::vector<chain::file_ref> refs = {
      {"full.data", 0, chain::file_kind::full},
      {"inc2.data", 2, chain::file_kind::incremental},
      {"inc1.data", 2, chain::file_kind::incremental},
  };
  CHECK(chain::backup_chain::from_refs(refs).status.code == error_code::chain_error);
}

TEST_CASE("chains reject duplicate files") {
  CHECK(chain::backup_chain::from_list("full.data,inc.data,inc.data").status.code == error_code::chain_error);
}
