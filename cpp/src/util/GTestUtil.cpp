#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// testing::InitGoogleTest() exits right after printing its own --help, and our parser would reject
// the gtest flags. So: print our help first if asked, then let gtest consume (and strip) its flags,
// then parse what remains.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  util::Random::Params random_params;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      std::cout << desc << std::endl;
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  try {
    po2::parse_args(desc, argc, argv);
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
