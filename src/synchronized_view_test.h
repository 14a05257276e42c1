#ifndef SYNCHRONIZED_VIEW_TEST_H
#define SYNCHRONIZED_VIEW_TEST_H

int run_tst_synchronized_view(int argc, char** argv);

#endif // SYNCHRONIZED_VIEW_TEST_H
