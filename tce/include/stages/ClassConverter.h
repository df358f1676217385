#pragma once

#include "syntax/SyntaxNode.h"
#include <string>

namespace TCE {

/**
 * @brief Turns a unittest.TestCase subclass into a plain pytest test class
 *
 * - the base list is removed;
 * - setUp/tearDown merge into one autouse fixture:
 * @code
 * @pytest.fixture(autouse=True)
 * def setup_method(self):
 *     <setUp body>
 *     yield
 *     <tearDown body>
 * @endcode
 * - setUpClass/tearDownClass become setup_class/teardown_class;
 * - `super().<hook>()` calls inside the hooks are dropped.
 *
 * The conversion is all or nothing: any shape it cannot express throws.
 */
class ClassConverter {
public:
    static constexpr const char *FIXTURE_DECORATOR = "pytest.fixture(autouse=True)";
    static constexpr const char *SETUP_METHOD = "setup_method";

    /**
     * @brief Converted copy of classDef
     * @throws RewriteError when TestCase members are still used, a hook has
     *         an unexpected signature or decorators, setUp returns early, or
     *         the pytest hook names are already taken
     */
    static NodePtr convert(const NodePtr &classDef);

    /**
     * @brief pytest name of a unittest hook ("setUpClass" -> "setup_class"), empty if none
     */
    static std::string pytestHookName(const std::string &hook);
};

}  // namespace TCE
