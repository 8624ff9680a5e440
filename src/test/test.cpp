/* Unit tests of hornet. `main` is given by gtest_main. */

#include "./test_util.h"
#include "./test_kb.h"
#include "./test_parse.h"
#include "./test_infer.h"
#include "./test_diag.h"
#include "./test_binary.h"
