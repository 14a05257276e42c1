#ifndef OBSERVABLE_RING_BUFFER_TEST_H
#define OBSERVABLE_RING_BUFFER_TEST_H

int run_tst_observable_ring_buffer(int argc, char** argv);

#endif // OBSERVABLE_RING_BUFFER_TEST_H
