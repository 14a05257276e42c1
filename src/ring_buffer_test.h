#ifndef RING_BUFFER_TEST_H
#define RING_BUFFER_TEST_H

int run_tst_ring_buffer(int argc, char** argv);

#endif // RING_BUFFER_TEST_H
