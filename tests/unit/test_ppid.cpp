#include <doctest/doctest.h>
#include "dcp/errors.hpp"
#include "dcp/event_extractor.hpp"
#include "dcp/gate.hpp"
#include "dcp/ppid.hpp"
#include "dcp/segmenter.hpp"

using namespace dcp;
using Keys = std::vector<std::string>;

static const KwargSpec& cook() {
  static const KwargSpec s = {{"temperature", 90.0}, {"te", std::string("a")}, {"outside", false},
                              {"with_water", true}, {"amount", 1000}, {"wine_type", std::string("red")},
                              {"test_oven", true}};
  return s;
}

TEST_CASE("pipeline hash is stable"){
  CHECK(compute_pipeline_hash("7", "hdf:p=0.34", "sparsemed:k=200^s=1^t=0^f=0.8",
                              "thresh:t=-3:cle=1^f=1^clo=2", "legacy:b=1^h=0", "norm:o=0^s=11")
        == "ec11977fc233e133c29642736161f201");
}

TEST_CASE("unique prefix"){
  CHECK(get_unique_prefix(Keys{"camera", "campus"}) == Keys{"came", "camp"});
  CHECK(get_unique_prefix(Keys{"cole", "coleman"}) == Keys{"cole", "colem"});
  CHECK(get_unique_prefix(Keys{"cole", "coleman", "colemine"}) == Keys{"cole", "colema", "colemi"});
  CHECK(get_unique_prefix(Keys{"cole", "coleman", "cundis"}) == Keys{"cole", "colem", "cu"});
  CHECK(get_unique_prefix(Keys{"an", "and", "anderson", "andersrum", "ant"}) ==
        Keys{"an", "and", "anderso", "andersr", "ant"});
  // input order does not matter
  CHECK(get_unique_prefix(Keys{"campus", "camera"}) == Keys{"camp", "came"});
  CHECK(get_unique_prefix(Keys{"coleman", "cole", "colemine"}) == Keys{"colema", "cole", "colemi"});
  CHECK(get_unique_prefix(Keys{"an", "andersrum", "and", "anderson", "ant"}) ==
        Keys{"an", "andersr", "and", "anderso", "ant"});
}

TEST_CASE("kwargs to ppid"){
  CHECK(kwargs_to_ppid(cook(), {}) == "tem=90^te=a^o=0^wit=1^a=1000^win=red^tes=1");
  CHECK(kwargs_to_ppid(cook(), {{"temperature", 10.1}}) == "tem=10.1^te=a^o=0^wit=1^a=1000^win=red^tes=1");
  CHECK(kwargs_to_ppid(cook(), {{"with_water", false}, {"wine_type", std::string("blue")}}) ==
        "tem=90^te=a^o=0^wit=0^a=1000^win=blue^tes=1");
  CHECK_THROWS_AS(kwargs_to_ppid(cook(), {{"salt", 1}}), ConfigError);
}

TEST_CASE("ppid to kwargs"){
  Kwargs def = defaults_of(cook());
  CHECK(ppid_to_kwargs(cook(), "tem=90^te=a^o=0^wit=1^a=1000^win=red^tes=1") == def);

  Kwargs warm = def;
  warm["temperature"] = 10.1;
  CHECK(ppid_to_kwargs(cook(), "tem=10.1^te=a^o=0^wit=1^a=1000^win=red^tes=1") == warm);

  Kwargs blue = def;
  blue["with_water"] = false;
  blue["wine_type"] = std::string("blue");
  CHECK(ppid_to_kwargs(cook(), "tem=90^te=a^o=0^wit=0^a=1000^win=blue^tes=1") == blue);

  CHECK(ppid_to_kwargs(cook(), "te=a^tem=90^o=0^wit=1^a=1000^win=red^tes=1") == def);
  CHECK(ppid_to_kwargs(cook(), "tem=90^te=a^o=0^wit=1^a=1000^win=red") == def);
  CHECK(ppid_to_kwargs(cook(), "tem=90^te=a^o=0^w=1^a=1000") == def);
  CHECK(ppid_to_kwargs(cook(), "") == def);
}

TEST_CASE("malformed identifiers"){
  CHECK_THROWS_AS(ppid_to_kwargs(cook(), "tem"), ConfigError);
  CHECK_THROWS_AS(ppid_to_kwargs(cook(), "tem=1=2"), ConfigError);
  CHECK_THROWS_AS(ppid_to_kwargs(cook(), "zzz=1"), ConfigError);
  CHECK_THROWS_AS(ppid_to_kwargs(cook(), "a=lots"), ConfigError);
  CHECK_THROWS_AS(split_ppid("legacy:b=1", "thresh"), ConfigError);
  CHECK_THROWS_AS(EventExtractor::get_ppkw_from_ppid("thresh:b=1^h=1"), ConfigError);
}

TEST_CASE("stage identifiers"){
  CHECK(EventExtractor::get_ppid_from_ppkw({}) == "legacy:b=1^h=1");
  CHECK(EventExtractor::get_ppid_from_ppkw({{"haralick", false}}) == "legacy:b=1^h=0");
  SegmenterThresh seg(ThreshParams{-3}, MaskPostParams{});
  CHECK(seg.get_ppid() == "thresh:t=-3:cle=1^f=1^clo=2");
  auto kw = SegmenterThresh::get_ppkw_from_ppid("thresh:t=-3:clo=1");
  CHECK(std::get<double>(kw.first["thresh"]) == -3);
  CHECK(std::get<int>(kw.second["closing_disk"]) == 1);
  CHECK(std::get<bool>(kw.second["fill_holes"]));
  GateParams g;
  g.size_thresh_mask = 11;
  CHECK(Gate(g).get_ppid() == "norm:o=0^s=11");
}
